#include "forms_json.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/builder/basic/sub_array.hpp>
#include <bsoncxx/json.hpp>

namespace morph {

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;
using bsoncxx::builder::basic::sub_array;

std::string forms_to_json(const std::string& word, const FormsResult& result) {
    auto doc = make_document(
        kvp("word", word),
        kvp("stem", result.stem),
        kvp("forms", [&result](sub_array forms) {
            for (const auto& form : result.forms) {
                forms.append(form);
            }
        })
    );

    return bsoncxx::to_json(doc.view());
}

std::string error_to_json(const std::string& message) {
    return bsoncxx::to_json(make_document(kvp("error", message)).view());
}

}
