#pragma once

#include <string>
#include <memory>
#include <functional>

#include <mongocxx/client.hpp>
#include <mongocxx/database.hpp>
#include <mongocxx/collection.hpp>
#include <mongocxx/instance.hpp>

#include "config.hpp"

namespace morph {

// Страница корпуса: только HTML из поля db.text_field
struct CorpusDocument {
    std::string html;
};

class MongoDBClient {
public:
    explicit MongoDBClient(const DbConfig& config);
    ~MongoDBClient();

    bool connect();

    size_t count_documents();

    // Документы без строкового поля с текстом пропускаются
    void for_each_document(std::function<void(const CorpusDocument&)> callback, size_t limit = 0);

private:
    DbConfig config_;
    std::unique_ptr<mongocxx::instance> instance_;
    std::unique_ptr<mongocxx::client> client_;
    mongocxx::database db_;
    mongocxx::collection collection_;
};

}
