#pragma once

#include <string>

#include "form_generator.hpp"

namespace morph {

/**
 * JSON-ответ API: {"word": ..., "stem": ..., "forms": [...]}
 */
std::string forms_to_json(const std::string& word, const FormsResult& result);

// {"error": message}
std::string error_to_json(const std::string& message);

}
