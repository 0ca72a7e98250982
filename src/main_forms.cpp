#include "form_generator.hpp"
#include "morphology_data.hpp"
#include "stemmer.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <morphology.yaml> [options] [word ...]\n"
              << "\nOptions:\n"
              << "  --stem-only  Print stems only\n"
              << "\nWithout words, reads one word per line from stdin.\n";
}

void print_forms(const morph::FormGenerator& generator, const std::string& word, bool stem_only) {
    if (stem_only) {
        std::cout << word << "\t" << generator.stem(word) << "\n";
        return;
    }

    auto result = generator.generate(word);

    std::cout << word << " [" << result.stem << "]:";
    for (const auto& form : result.forms) {
        std::cout << " " << form;
    }
    std::cout << "\n";
}

}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string data_path = argv[1];
    std::vector<std::string> words;
    bool stem_only = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--stem-only") {
            stem_only = true;
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            words.push_back(arg);
        }
    }

    try {
        morph::MorphologyData data = morph::load_morphology_data(data_path);
        morph::GermanStemmer stemmer;
        morph::FormGenerator generator(data, stemmer);

        if (!words.empty()) {
            for (const auto& word : words) {
                print_forms(generator, word, stem_only);
            }
        } else {
            std::string line;
            while (std::getline(std::cin, line)) {
                if (!line.empty()) {
                    print_forms(generator, line, stem_only);
                }
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
