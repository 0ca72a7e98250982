#include "mongodb_client.hpp"
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/types.hpp>
#include <mongocxx/options/find.hpp>
#include <mongocxx/uri.hpp>
#include <iostream>

namespace morph {

MongoDBClient::MongoDBClient(const DbConfig& config) : config_(config) {
    instance_ = std::make_unique<mongocxx::instance>();
}

MongoDBClient::~MongoDBClient() = default;

bool MongoDBClient::connect() {
    try {
        std::string uri_str;

        if (!config_.username.empty() && !config_.password.empty()) {
            uri_str = "mongodb://" + config_.username + ":" + config_.password + "@" +
                      config_.host + ":" + std::to_string(config_.port);
        } else {
            uri_str = "mongodb://" + config_.host + ":" + std::to_string(config_.port);
        }

        mongocxx::uri uri(uri_str);
        client_ = std::make_unique<mongocxx::client>(uri);

        db_ = (*client_)[config_.database];
        collection_ = db_[config_.collection];

        std::cout << "✓ Подключение к MongoDB: " << config_.host << ":" << config_.port << std::endl;
        std::cout << "  База: " << config_.database << ", коллекция: " << config_.collection << std::endl;

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Ошибка подключения к MongoDB: " << e.what() << std::endl;
        return false;
    }
}

size_t MongoDBClient::count_documents() {
    return static_cast<size_t>(collection_.count_documents({}));
}

void MongoDBClient::for_each_document(
    std::function<void(const CorpusDocument&)> callback,
    size_t limit
) {
    const std::string& field = config_.text_field;

    auto opts = mongocxx::options::find{};
    opts.projection(bsoncxx::builder::basic::make_document(
        bsoncxx::builder::basic::kvp("_id", 0),
        bsoncxx::builder::basic::kvp(field, 1)
    ));

    if (limit > 0) {
        opts.limit(static_cast<int64_t>(limit));
    }

    auto cursor = collection_.find({}, opts);

    for (auto&& doc : cursor) {
        auto element = doc[field];
        if (!element || element.type() != bsoncxx::type::k_string) {
            continue;
        }

        auto html_view = element.get_string().value;
        callback(CorpusDocument{std::string(html_view.data(), html_view.length())});
    }
}

}
