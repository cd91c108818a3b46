#include <stencil/error.hpp>

namespace stencil {

const char* StencilError::code_name(Code c) {
    switch (c) {
        case IO:          return "IO";
        case Parse:       return "Parse";
        case Config:      return "Config";
        case Network:     return "Network";
        case NotFound:    return "NotFound";
        case InvalidArg:  return "InvalidArg";
        case Validation:  return "Validation";
        case Boundary:    return "Boundary";
        case Unsupported: return "Unsupported";
        case Registry:    return "Registry";
    }
    return "Unknown";
}

StencilError& StencilError::with(const std::string& key, std::string value) {
    for (auto& kv : context) {
        if (kv.first == key) {
            kv.second = std::move(value);
            return *this;
        }
    }
    context.emplace_back(key, std::move(value));
    return *this;
}

const std::string* StencilError::find(const std::string& key) const {
    for (const auto& kv : context) {
        if (kv.first == key) return &kv.second;
    }
    return nullptr;
}

std::string StencilError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    for (const auto& [key, value] : context) {
        result += "\n  ";
        result += key;
        result += ": ";
        result += value;
    }

    return result;
}

} // namespace stencil
