#include "mt/translation_interface.hpp"

#include <algorithm>
#include <cctype>

namespace soksak {
namespace mt {

bool isValidLanguageCode(const std::string& code) {
    if (code.empty() || code.size() > 16) {
        return false;
    }
    return std::all_of(code.begin(), code.end(), [](char c) {
        unsigned char uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) || c == '-' || c == '_';
    });
}

} // namespace mt
} // namespace soksak
