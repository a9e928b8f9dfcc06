#include "uiwire/key/path_cursor.hpp"


namespace uiwire {

std::ostream& operator<<(std::ostream& os, const ParseError& e) {
    switch (e.code) {
        case ParseError::Code::NoSymbolsLeft:
            os << "tried to parse the next symbol, but there are none left (position " << e.position
               << "); this could be a user error, but it could also be caused by not calling Ui::scope somewhere";
            break;
        case ParseError::Code::InvalidSymbol:
            os << "failed to parse the symbol at position " << e.position << " from a string; " << e.cause;
            break;
    }
    return os;
}

} // namespace uiwire
