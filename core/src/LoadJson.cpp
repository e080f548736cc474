#include "lv/core/util/LoadJson.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <limits>

#include "lv/core/util/Error.hpp"
#include "lv/core/util/ZstdCodec.hpp"

namespace lv::json {

bool is_zstd_path(const std::filesystem::path& path)
{
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext.find("zst") != std::string::npos;
}

std::string read_text_file(const std::filesystem::path& path)
{
    if (is_zstd_path(path)) {
        auto bytes = ZstdCodec{}.decodeFile(path);
        return std::string(bytes.begin(), bytes.end());
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw Error::io("cannot open " + path.string());
    }
    std::string text{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        throw Error::io("cannot read " + path.string());
    }
    return text;
}

nlohmann::json load_json_file(const std::filesystem::path& path)
{
    auto text = read_text_file(path);
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw Error::invalid("index.json parse error: " + std::string(e.what()));
    }
}

std::string dump_json(const nlohmann::json& doc, int indent)
{
    return doc.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

void require_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> fields,
    const std::string& context)
{
    if (!json.is_object()) {
        throw Error::invalid(context + " is not a JSON object");
    }
    for (const char* field : fields) {
        if (!json.contains(field)) {
            throw Error::invalid(context + " missing required field: " + field);
        }
    }
}

double number_or(const nlohmann::json* m, const char* key, double def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it == m->end()) return def;
    if (it->is_number_float())   return it->get<double>();
    if (it->is_number_integer()) return static_cast<double>(it->get<int64_t>());
    if (it->is_string()) {
        try {
            return std::stod(it->get<std::string>());
        } catch (const std::logic_error&) {
            return def;
        }
    }
    return def;
}

std::string string_or(const nlohmann::json* m, const char* key, const std::string& def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it != m->end() && it->is_string()) return it->get<std::string>();
    return def;
}

bool bool_or(const nlohmann::json* m, const char* key, bool def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it != m->end() && it->is_boolean()) return it->get<bool>();
    return def;
}

std::optional<std::string> optional_string(const nlohmann::json& m, const char* key, const std::string& context)
{
    auto it = m.find(key);
    if (it == m.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw Error::invalid(context + " field '" + key + "' must be a string");
    }
    return it->get<std::string>();
}

std::optional<uint64_t> optional_u64(const nlohmann::json& m, const char* key, const std::string& context)
{
    auto it = m.find(key);
    if (it == m.end() || it->is_null()) return std::nullopt;
    if (!it->is_number_unsigned()) {
        throw Error::invalid(context + " field '" + key + "' must be an unsigned integer");
    }
    return it->get<uint64_t>();
}

std::optional<uint32_t> optional_u32(const nlohmann::json& m, const char* key, const std::string& context)
{
    auto v = optional_u64(m, key, context);
    if (!v) return std::nullopt;
    if (*v > std::numeric_limits<uint32_t>::max()) {
        throw Error::invalid(context + " field '" + key + "' does not fit in 32 bits");
    }
    return static_cast<uint32_t>(*v);
}

} // namespace lv::json
