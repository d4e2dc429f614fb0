#include "plansync/literal.hpp"

namespace plansync {

    std::string encode_literal(std::string_view raw) {
        std::string out{};
        out.reserve(raw.size() + raw.size() / 8U);
        for (auto c : raw) {
            switch (c) {
                case '\\':
                    out += "\\\\";
                    break;
                case '"':
                    out += "\\\"";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                default:
                    out += c;
                    break;
            }
        }
        return out;
    }

    std::string decode_literal(std::string_view literal) {
        std::string out{};
        out.reserve(literal.size());
        for (size_t i = 0U; i < literal.size(); ++i) {
            auto c = literal[i];
            if (c != '\\' || i + 1U >= literal.size()) {
                out += c;
                continue;
            }

            auto next = literal[i + 1U];
            switch (next) {
                case '\\':
                    out += '\\';
                    break;
                case '"':
                    out += '"';
                    break;
                case 'n':
                    out += '\n';
                    break;
                default:
                    out += c;
                    out += next;
                    break;
            }
            ++i;
        }
        return out;
    }

    std::string quote_literal(std::string_view raw) {
        std::string out{"\""};
        out += encode_literal(raw);
        out += '"';
        return out;
    }

}  // namespace plansync
