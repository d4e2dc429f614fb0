#pragma once

#include <string>
#include <string_view>

namespace plansync {

    // Escapes backslash, then double quote, then newline
    std::string encode_literal(std::string_view raw);

    // Exact inverse of encode_literal; unknown escapes are kept verbatim
    std::string decode_literal(std::string_view literal);

    // encode_literal wrapped in double quotes, the form a literal takes in a fixture
    std::string quote_literal(std::string_view raw);

}  // namespace plansync
