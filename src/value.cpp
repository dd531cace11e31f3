#include <folio-cpp/value.hpp>

#include <array>
#include <charconv>

namespace folio_cpp {

auto to_string(const ScalarValue& v) -> std::string {
    return std::visit(overload{
        [](const Null&) -> std::string { return "null"; },
        [](bool b) -> std::string { return b ? "true" : "false"; },
        [](std::int64_t i) -> std::string { return std::to_string(i); },
        [](double d) -> std::string {
            auto buf = std::array<char, 32>{};
            auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), d);
            return std::string(buf.data(), ptr);
        },
        [](const std::string& s) -> std::string {
            auto out = std::string{"\""};
            for (char c : s) {
                if (c == '"' || c == '\\') out.push_back('\\');
                out.push_back(c);
            }
            out.push_back('"');
            return out;
        },
    }, v);
}

}  // namespace folio_cpp
