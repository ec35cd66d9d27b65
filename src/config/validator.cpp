#include <qwire/config/validator.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace qwire::config {

static std::string lowered(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_valid_identifier(const std::string& name, std::string& err) {
    if (name.empty()) { err = "register name is empty"; return false; }
    if (!std::islower(static_cast<unsigned char>(name[0]))) {
        err = "register name '" + name + "' must start with a lowercase letter"; return false; }
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) {
            err = "register name '" + name + "' contains invalid characters"; return false; }
    }
    return true;
}

bool parse_bit_order(const std::string& text, sim::BitOrder& order, std::string& err) {
    std::string t = lowered(text);
    if (t == "little" || t == "little_endian") { order = sim::BitOrder::LittleEndian; return true; }
    if (t == "as_written") { order = sim::BitOrder::AsWritten; return true; }
    err = "bit_order must be 'little' or 'as_written', got '" + text + "'";
    return false;
}

bool parse_bool(const std::string& text, bool& value, std::string& err) {
    std::string t = lowered(text);
    if (t == "true" || t == "1" || t == "yes" || t == "on") { value = true; return true; }
    if (t == "false" || t == "0" || t == "no" || t == "off") { value = false; return true; }
    err = "expected a boolean, got '" + text + "'";
    return false;
}

bool parse_count(const std::string& text, std::size_t& value, std::string& err) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        err = "expected a non-negative integer, got '" + text + "'"; return false; }
    try {
        value = static_cast<std::size_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        err = "integer out of range: '" + text + "'"; return false;
    }
    return true;
}

} // namespace qwire::config
