#include "nearshare/storage/file_naming.hpp"

namespace nearshare::storage {

namespace {
    bool is_space(char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }

    std::string_view trim_view(std::string_view text) {
        while (!text.empty() && is_space(text.front())) {
            text.remove_prefix(1);
        }
        while (!text.empty() && is_space(text.back())) {
            text.remove_suffix(1);
        }
        return text;
    }

    bool is_continuation_byte(char c) {
        return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
    }

    std::string_view truncate_utf8(std::string_view text, std::size_t max_bytes) {
        if (text.size() <= max_bytes) {
            return text;
        }
        std::size_t cut = max_bytes;
        while (cut > 0 && is_continuation_byte(text[cut])) {
            --cut;
        }
        return text.substr(0, cut);
    }
}

std::string sanitize_file_name(std::string_view name) {
    std::string replaced(name);
    for (auto& c : replaced) {
        if (FORBIDDEN_NAME_CHARACTERS.find(c) != std::string_view::npos) {
            c = '_';
        }
    }

    auto result = trim_view(replaced);
    result = trim_view(truncate_utf8(result, MAX_FILE_NAME_BYTES));

    if (result.empty() || result == "." || result == "..") {
        return std::string(PLACEHOLDER_FILE_NAME);
    }
    return std::string(result);
}

bool is_safe_file_name(std::string_view name) {
    return !name.empty() && sanitize_file_name(name) == name;
}

} // namespace nearshare::storage
