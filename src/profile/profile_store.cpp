/**
 * @file profile_store.cpp
 * @brief Implementation of profile_store
 */

#include "kcenon/batch_transfer/profile/profile_store.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <sstream>

#include "kcenon/batch_transfer/core/logging.h"

namespace kcenon::batch_transfer {

// ============================================================================
// JSON helpers (simple implementation without external library)
// ============================================================================

namespace {

using detail::escape_json_string;

/**
 * @brief Parsed JSON node; objects keep member order, arrays are discarded
 */
struct json_node {
    enum class kind { null, scalar, string, object };

    kind type = kind::null;
    std::string text;
    std::vector<std::pair<std::string, json_node>> members;

    [[nodiscard]] auto member(const std::string& key) const -> const json_node* {
        for (const auto& [name, value] : members) {
            if (name == key) {
                return &value;
            }
        }
        return nullptr;
    }
};

class json_reader {
public:
    explicit json_reader(const std::string& input) : input_(input) {}

    auto parse(json_node& root) -> result<void> {
        auto parsed = parse_value(root, 0);
        if (!parsed.has_value()) {
            return parsed;
        }
        skip_whitespace();
        if (pos_ != input_.size()) {
            return fail("Trailing characters after JSON document");
        }
        return {};
    }

private:
    static constexpr int max_depth = 32;

    auto fail(const std::string& what) const -> result<void> {
        return unexpected{error{error_code::profile_parse_error,
                                what + " at offset " + std::to_string(pos_)}};
    }

    void skip_whitespace() {
        while (pos_ < input_.size() &&
               (input_[pos_] == ' ' || input_[pos_] == '\n' ||
                input_[pos_] == '\r' || input_[pos_] == '\t')) {
            ++pos_;
        }
    }

    auto parse_value(json_node& node, int depth) -> result<void> {
        if (depth > max_depth) {
            return fail("JSON nesting too deep");
        }
        skip_whitespace();
        if (pos_ >= input_.size()) {
            return fail("Unexpected end of input");
        }

        const char c = input_[pos_];
        if (c == '{') {
            return parse_object(node, depth);
        }
        if (c == '[') {
            return skip_array(depth);
        }
        if (c == '"') {
            node.type = json_node::kind::string;
            return parse_string(node.text);
        }
        return parse_scalar(node);
    }

    auto parse_object(json_node& node, int depth) -> result<void> {
        node.type = json_node::kind::object;
        ++pos_;  // '{'
        skip_whitespace();
        if (pos_ < input_.size() && input_[pos_] == '}') {
            ++pos_;
            return {};
        }

        while (true) {
            skip_whitespace();
            if (pos_ >= input_.size() || input_[pos_] != '"') {
                return fail("Expected object key");
            }
            std::string key;
            auto key_parsed = parse_string(key);
            if (!key_parsed.has_value()) {
                return key_parsed;
            }

            skip_whitespace();
            if (pos_ >= input_.size() || input_[pos_] != ':') {
                return fail("Expected ':'");
            }
            ++pos_;

            json_node value;
            auto value_parsed = parse_value(value, depth + 1);
            if (!value_parsed.has_value()) {
                return value_parsed;
            }
            node.members.emplace_back(std::move(key), std::move(value));

            skip_whitespace();
            if (pos_ >= input_.size()) {
                return fail("Unterminated object");
            }
            if (input_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (input_[pos_] == '}') {
                ++pos_;
                return {};
            }
            return fail("Expected ',' or '}'");
        }
    }

    auto skip_array(int depth) -> result<void> {
        ++pos_;  // '['
        skip_whitespace();
        if (pos_ < input_.size() && input_[pos_] == ']') {
            ++pos_;
            return {};
        }
        while (true) {
            json_node ignored;
            auto parsed = parse_value(ignored, depth + 1);
            if (!parsed.has_value()) {
                return parsed;
            }
            skip_whitespace();
            if (pos_ >= input_.size()) {
                return fail("Unterminated array");
            }
            if (input_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (input_[pos_] == ']') {
                ++pos_;
                return {};
            }
            return fail("Expected ',' or ']'");
        }
    }

    auto parse_string(std::string& out) -> result<void> {
        ++pos_;  // opening quote
        while (pos_ < input_.size()) {
            char c = input_[pos_++];
            if (c == '"') {
                return {};
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= input_.size()) {
                break;
            }
            char esc = input_[pos_++];
            switch (esc) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    uint32_t code = 0;
                    auto unit = parse_hex4(code);
                    if (!unit.has_value()) {
                        return unit;
                    }
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate; must pair with a following \uDC00-\uDFFF.
                        uint32_t low = 0;
                        if (pos_ + 2 > input_.size() || input_[pos_] != '\\' ||
                            input_[pos_ + 1] != 'u') {
                            return fail("Unpaired surrogate in \\u escape");
                        }
                        pos_ += 2;
                        auto second = parse_hex4(low);
                        if (!second.has_value()) {
                            return second;
                        }
                        if (low < 0xDC00 || low > 0xDFFF) {
                            return fail("Unpaired surrogate in \\u escape");
                        }
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        return fail("Unpaired surrogate in \\u escape");
                    }
                    append_utf8(out, code);
                    break;
                }
                default:
                    return fail("Invalid escape sequence");
            }
        }
        return fail("Unterminated string");
    }

    auto parse_hex4(uint32_t& code) -> result<void> {
        if (pos_ + 4 > input_.size()) {
            return fail("Truncated \\u escape");
        }
        code = 0;
        for (int i = 0; i < 4; ++i) {
            char h = input_[pos_++];
            code <<= 4;
            if (h >= '0' && h <= '9') {
                code |= static_cast<uint32_t>(h - '0');
            } else if (h >= 'a' && h <= 'f') {
                code |= static_cast<uint32_t>(h - 'a' + 10);
            } else if (h >= 'A' && h <= 'F') {
                code |= static_cast<uint32_t>(h - 'A' + 10);
            } else {
                return fail("Invalid hex digit in \\u escape");
            }
        }
        return {};
    }

    auto parse_scalar(json_node& node) -> result<void> {
        auto start = pos_;
        while (pos_ < input_.size() && input_[pos_] != ',' && input_[pos_] != '}' &&
               input_[pos_] != ']' && input_[pos_] != ' ' && input_[pos_] != '\n' &&
               input_[pos_] != '\r' && input_[pos_] != '\t') {
            ++pos_;
        }
        auto token = input_.substr(start, pos_ - start);
        if (token.empty()) {
            return fail("Expected value");
        }
        if (token == "null") {
            node.type = json_node::kind::null;
            return {};
        }
        if (token != "true" && token != "false" &&
            token.find_first_not_of("-+.0123456789eE") != std::string::npos) {
            pos_ = start;
            return fail("Invalid literal '" + token + "'");
        }
        node.type = json_node::kind::scalar;
        node.text = std::move(token);
        return {};
    }

    static void append_utf8(std::string& out, uint32_t code) {
        if (code < 0x80) {
            out += static_cast<char>(code);
        } else if (code < 0x800) {
            out += static_cast<char>(0xC0 | (code >> 6));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else if (code < 0x10000) {
            out += static_cast<char>(0xE0 | (code >> 12));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (code >> 18));
            out += static_cast<char>(0x80 | ((code >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        }
    }

    const std::string& input_;
    std::size_t pos_ = 0;
};

auto text_of(const json_node& object, const std::string& key) -> std::string {
    const auto* value = object.member(key);
    if (value == nullptr || value->type == json_node::kind::null) {
        return "";
    }
    return value->text;
}

auto profile_from_json(const std::string& name, const json_node& node)
    -> result<session_options> {
    if (node.type != json_node::kind::object) {
        return unexpected{error{error_code::profile_parse_error,
                                "Profile '" + name + "' is not an object"}};
    }

    session_options options;
    options.host = text_of(node, "host");
    options.username = text_of(node, "username");
    options.password = text_of(node, "password");
    options.key_path = text_of(node, "key_path");
    options.key_passphrase = text_of(node, "key_passphrase");
    options.remote_dir = text_of(node, "remote_dir");

    auto auth = text_of(node, "auth");
    if (auth.empty() || auth == "password") {
        options.auth = auth_method::password;
    } else if (auth == "key") {
        options.auth = auth_method::private_key;
    } else {
        return unexpected{error{error_code::profile_parse_error,
                                "Profile '" + name + "' has unknown auth '" + auth + "'"}};
    }

    // Port is written as a number but older files store it as a string.
    auto port = text_of(node, "port");
    if (!port.empty()) {
        char* end = nullptr;
        auto value = std::strtol(port.c_str(), &end, 10);
        if (end == port.c_str() || *end != '\0' || value < 1 || value > 65535) {
            return unexpected{error{error_code::profile_parse_error,
                                    "Profile '" + name + "' has invalid port '" + port + "'"}};
        }
        options.port = static_cast<uint16_t>(value);
    }
    return options;
}

void write_profile(std::ostringstream& oss, const std::string& name,
                   const session_options& options) {
    oss << "    \"" << escape_json_string(name) << "\": {\n";
    oss << "      \"host\": \"" << escape_json_string(options.host) << "\",\n";
    oss << "      \"port\": " << options.port << ",\n";
    oss << "      \"username\": \"" << escape_json_string(options.username) << "\",\n";
    oss << "      \"auth\": \"" << to_string(options.auth) << "\",\n";
    oss << "      \"password\": \"" << escape_json_string(options.password) << "\",\n";
    oss << "      \"key_path\": \"" << escape_json_string(options.key_path.string()) << "\",\n";
    if (!options.key_passphrase.empty()) {
        oss << "      \"key_passphrase\": \"" << escape_json_string(options.key_passphrase)
            << "\",\n";
    }
    oss << "      \"remote_dir\": \"" << escape_json_string(options.remote_dir) << "\"\n";
    oss << "    }";
}

}  // namespace

// ============================================================================
// profile_store implementation
// ============================================================================

profile_store::profile_store(std::filesystem::path file) : file_(std::move(file)) {}

auto profile_store::default_path() -> std::filesystem::path {
    const char* home = std::getenv("HOME");
#if defined(_WIN32)
    if (home == nullptr) {
        home = std::getenv("USERPROFILE");
    }
#endif
    std::filesystem::path base = home != nullptr ? std::filesystem::path(home)
                                                 : std::filesystem::current_path();
    return base / ".batch_transfer" / "profiles.json";
}

auto profile_store::load() -> result<void> {
    std::error_code ec;
    if (!std::filesystem::exists(file_, ec)) {
        std::unique_lock lock(mutex_);
        profiles_.clear();
        default_.clear();
        BT_LOG_DEBUG(log_category::profile,
                     "Profile file not found, starting empty: " + file_.string());
        return {};
    }

    std::ifstream file(file_, std::ios::binary);
    if (!file) {
        BT_LOG_ERROR(log_category::profile, "Failed to open profile file: " + file_.string());
        return unexpected{error{error_code::file_read_error,
                                "Failed to open profile file: " + file_.string()}};
    }
    std::ostringstream content;
    content << file.rdbuf();
    const auto json = content.str();

    json_node root;
    json_reader reader(json);
    auto parsed = reader.parse(root);
    if (!parsed.has_value()) {
        BT_LOG_ERROR(log_category::profile,
                     "Failed to parse profile file: " + parsed.error().message);
        return parsed;
    }
    if (root.type != json_node::kind::object) {
        return unexpected{error{error_code::profile_parse_error,
                                "Profile file must contain a JSON object"}};
    }

    const json_node* section = root.member("profiles");
    if (section == nullptr) {
        section = root.member("presets");
    }

    std::vector<entry> loaded;
    if (section != nullptr && section->type == json_node::kind::object) {
        for (const auto& [name, node] : section->members) {
            auto options = profile_from_json(name, node);
            if (!options.has_value()) {
                BT_LOG_ERROR(log_category::profile, options.error().message);
                return unexpected{options.error()};
            }
            auto existing = std::find_if(loaded.begin(), loaded.end(),
                                         [&](const entry& e) { return e.first == name; });
            if (existing != loaded.end()) {
                existing->second = std::move(options.value());
            } else {
                loaded.emplace_back(name, std::move(options.value()));
            }
        }
    }

    std::unique_lock lock(mutex_);
    profiles_ = std::move(loaded);
    default_ = text_of(root, "default");
    BT_LOG_INFO(log_category::profile,
                "Loaded " + std::to_string(profiles_.size()) + " profile(s) from " +
                    file_.string());
    return {};
}

auto profile_store::save() const -> result<void> {
    std::ostringstream oss;
    {
        std::shared_lock lock(mutex_);
        oss << "{\n";
        oss << "  \"default\": \"" << escape_json_string(default_) << "\",\n";
        oss << "  \"profiles\": {";
        bool first = true;
        for (const auto& [name, options] : profiles_) {
            oss << (first ? "\n" : ",\n");
            write_profile(oss, name, options);
            first = false;
        }
        oss << (first ? "}\n" : "\n  }\n");
        oss << "}\n";
    }

    std::error_code ec;
    if (file_.has_parent_path()) {
        std::filesystem::create_directories(file_.parent_path(), ec);
        if (ec) {
            BT_LOG_ERROR(log_category::profile,
                         "Failed to create profile directory: " + ec.message());
            return unexpected{error{error_code::file_write_error,
                                    "Failed to create directory: " + ec.message()}};
        }
    }

    // Write to a temporary file first so a failed write keeps the old file.
    auto temp_path = file_;
    temp_path += ".tmp";
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            BT_LOG_ERROR(log_category::profile,
                         "Failed to open profile file for writing: " + temp_path.string());
            return unexpected{error{error_code::file_write_error,
                                    "Failed to open profile file for writing"}};
        }
        file << oss.str();
        if (!file) {
            return unexpected{error{error_code::file_write_error,
                                    "Failed to write profile file"}};
        }
    }

    std::filesystem::rename(temp_path, file_, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return unexpected{error{error_code::file_write_error,
                                "Failed to replace profile file"}};
    }

    BT_LOG_DEBUG(log_category::profile, "Saved profiles to " + file_.string());
    return {};
}

auto profile_store::upsert(const std::string& name, const session_options& options)
    -> result<void> {
    if (name.empty()) {
        return unexpected{error{error_code::invalid_request, "Profile name is required"}};
    }

    std::unique_lock lock(mutex_);
    auto it = locate(name);
    if (it != profiles_.end()) {
        it->second = options;
    } else {
        profiles_.emplace_back(name, options);
    }
    if (default_.empty()) {
        default_ = name;
    }
    return {};
}

auto profile_store::remove(const std::string& name) -> result<void> {
    std::unique_lock lock(mutex_);
    auto it = locate(name);
    if (it == profiles_.end()) {
        return unexpected{error{error_code::profile_not_found,
                                "No profile named '" + name + "'"}};
    }
    profiles_.erase(it);
    if (default_ == name) {
        default_ = profiles_.empty() ? std::string{} : profiles_.front().first;
    }
    return {};
}

auto profile_store::set_default(const std::string& name) -> result<void> {
    std::unique_lock lock(mutex_);
    if (locate(name) == profiles_.end()) {
        return unexpected{error{error_code::profile_not_found,
                                "Save profile '" + name + "' first"}};
    }
    default_ = name;
    return {};
}

auto profile_store::find(const std::string& name) const -> std::optional<session_options> {
    std::shared_lock lock(mutex_);
    auto it = locate(name);
    if (it == profiles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto profile_store::contains(const std::string& name) const -> bool {
    std::shared_lock lock(mutex_);
    return locate(name) != profiles_.end();
}

auto profile_store::names() const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(profiles_.size());
    for (const auto& [name, options] : profiles_) {
        result.push_back(name);
    }
    return result;
}

auto profile_store::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return profiles_.size();
}

auto profile_store::default_name() const -> std::string {
    std::shared_lock lock(mutex_);
    return default_;
}

auto profile_store::default_profile() const -> std::optional<session_options> {
    std::shared_lock lock(mutex_);
    auto it = locate(default_);
    if (it == profiles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto profile_store::locate(const std::string& name) -> std::vector<entry>::iterator {
    return std::find_if(profiles_.begin(), profiles_.end(),
                        [&name](const entry& e) { return e.first == name; });
}

auto profile_store::locate(const std::string& name) const
    -> std::vector<entry>::const_iterator {
    return std::find_if(profiles_.begin(), profiles_.end(),
                        [&name](const entry& e) { return e.first == name; });
}

}  // namespace kcenon::batch_transfer
