//
// Parser constants - named constants to replace magic numbers
//

#ifndef DFSCAN_PARSER_CONSTANTS_H
#define DFSCAN_PARSER_CONSTANTS_H

#include <cstddef>

namespace dfscan::parser {

/* Stage aliases follow the image-name length limit */
constexpr std::size_t MAX_STAGE_NAME_LENGTH = 128;

} // namespace dfscan::parser

#endif // DFSCAN_PARSER_CONSTANTS_H
