#include "config.hpp"
#include "form_generator.hpp"
#include "mongodb_client.hpp"
#include "morphology_data.hpp"
#include "stemmer.hpp"
#include "tokenizer.hpp"
#include "word_families.hpp"

#include <algorithm>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <fstream>
#include <vector>

using namespace morph;

void print_usage() {
    std::cout << "Использование:\n";
    std::cout << "  ./corpus_families <config.yaml>                 - обработать весь корпус\n";
    std::cout << "  ./corpus_families <config.yaml> --limit 100     - обработать 100 документов\n";
    std::cout << "  ./corpus_families <config.yaml> --test          - тестовый режим (10 документов)\n";
    std::cout << "  ./corpus_families <config.yaml> --query Stadt   - найти формы слова в корпусе\n";
}

std::string join_members(const WordFamily& family, size_t max_members) {
    std::string result;
    for (size_t i = 0; i < std::min(max_members, family.members.size()); ++i) {
        if (i > 0) result += ", ";
        result += family.members[i].token + " (" + std::to_string(family.members[i].count) + ")";
    }
    return result;
}

void print_statistics(const FamilyStats& stats, const std::vector<WordFamily>& families,
                      size_t total_documents, double processing_time_sec) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "📊 СТАТИСТИКА СЕМЕЙСТВ СЛОВОФОРМ\n";
    std::cout << std::string(60, '=') << "\n";

    std::cout << "\n📁 Документы: " << total_documents << "\n";

    std::cout << "\n📝 Существительные:\n";
    std::cout << "   Всего токенов: " << stats.total_tokens << "\n";
    std::cout << "   Уникальных токенов: " << stats.distinct_tokens << "\n";
    std::cout << "   Семейств (основ): " << stats.families << "\n";
    std::cout << "   Форм на токен: " << std::fixed << std::setprecision(2)
              << stats.avg_forms_per_token() << "\n";

    std::cout << "\n⏱️ Время: " << std::fixed << std::setprecision(2)
              << processing_time_sec << " сек\n";

    std::cout << "\n🔝 Топ-20 семейств:\n";
    for (size_t i = 0; i < std::min(size_t(20), families.size()); ++i) {
        std::cout << "   " << std::setw(2) << (i + 1) << ". "
                  << families[i].stem << " [" << families[i].total_count << "]: "
                  << join_members(families[i], 5) << "\n";
    }

    std::cout << std::string(60, '=') << "\n";
}

void save_families(const FamilyStats& stats, const std::vector<WordFamily>& families,
                   const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "Ошибка сохранения семейств в " << path << std::endl;
        return;
    }

    file << "СЕМЕЙСТВА СЛОВОФОРМ\n";
    file << std::string(60, '=') << "\n\n";
    file << "Токенов: " << stats.total_tokens << "\n";
    file << "Уникальных токенов: " << stats.distinct_tokens << "\n";
    file << "Семейств: " << stats.families << "\n\n";

    for (const auto& family : families) {
        file << family.stem << "\t" << family.total_count << "\t"
             << join_members(family, family.members.size()) << "\n";
    }

    file.close();
    std::cout << "📄 Семейства сохранены: " << path << std::endl;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string config_path = argv[1];
    size_t limit = 0;
    std::vector<std::string> queries;

    // Парсим аргументы
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--limit" && i + 1 < argc) {
            limit = std::stoul(argv[++i]);
        } else if (arg == "--test") {
            limit = 10;
        } else if (arg == "--query" && i + 1 < argc) {
            queries.push_back(argv[++i]);
        }
    }

    std::cout << std::string(60, '=') << "\n";
    std::cout << "🔤 СЕМЕЙСТВА НЕМЕЦКИХ СУЩЕСТВИТЕЛЬНЫХ (C++)\n";
    std::cout << std::string(60, '=') << "\n";

    try {
        // Загружаем конфигурацию и морфологию
        AppConfig config = load_config(config_path);
        MorphologyData data = load_morphology_data(config.morphology_path);

        GermanStemmer stemmer;
        FormGenerator generator(data, stemmer);
        WordFamilyIndex index(generator);

        // Подключаемся к MongoDB
        MongoDBClient db_client(config.db);
        if (!db_client.connect()) {
            return 1;
        }

        size_t total_docs = db_client.count_documents();
        if (limit > 0) {
            total_docs = std::min(total_docs, limit);
        }

        std::cout << "\n📚 Обработка " << total_docs << " документов...\n";
        std::cout << std::string(60, '=') << "\n";

        // Немецкие существительные пишутся с заглавной буквы
        Tokenizer::Config tok_config;
        tok_config.min_length = 3;
        tok_config.lowercase = false;
        tok_config.remove_stopwords = true;
        tok_config.nouns_only = true;

        Tokenizer tokenizer(tok_config);
        size_t processed = 0;

        auto start_time = std::chrono::high_resolution_clock::now();

        db_client.for_each_document([&](const CorpusDocument& doc) {
            processed++;

            if (doc.html.empty()) return;

            for (const auto& token : tokenizer.tokenize(tokenizer.extract_text(doc.html))) {
                index.add(token);
            }

            // Прогресс
            if (processed % 100 == 0) {
                auto now = std::chrono::high_resolution_clock::now();
                double elapsed = std::chrono::duration<double>(now - start_time).count();

                std::cout << "  [" << processed << "/" << total_docs << "] "
                          << "токенов: " << index.stats().total_tokens << ", "
                          << "скорость: " << std::fixed << std::setprecision(1)
                          << processed / elapsed << " док/сек\n";
            }
        }, limit);

        auto end_time = std::chrono::high_resolution_clock::now();
        double processing_time = std::chrono::duration<double>(end_time - start_time).count();

        auto stats = index.stats();
        auto families = index.families();

        print_statistics(stats, families, processed, processing_time);
        save_families(stats, families, "word_families.txt");

        for (const auto& query : queries) {
            auto result = generator.generate(query);
            auto found = index.matches(query);

            std::cout << "\n🔎 " << query << " [" << result.stem << "]: "
                      << result.forms.size() << " форм, в корпусе " << found.size() << "\n";
            for (const auto& member : found) {
                std::cout << "   " << member.token << ": " << member.count << "\n";
            }
        }

        std::cout << "\n✅ Обработка завершена!\n";

    } catch (const std::exception& e) {
        std::cerr << "Ошибка: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
