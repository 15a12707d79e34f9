#ifndef TITLECASE_FWD_HPP
#define TITLECASE_FWD_HPP

#include "titlecase/settings.hpp"

TITLECASE_IF_DEBUG() // silence unused warning for settings.hpp

namespace titlecase {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define TITLECASE_ENUM_STRING_CASE8(...)                                                           \
    case __VA_ARGS__: return u8## #__VA_ARGS__

struct Diagnostic;
struct Ignorant_Logger;
enum struct IO_Error_Code : Default_Underlying;
struct Lexicon;
enum struct Lexicon_Error_Code : Default_Underlying;
struct Lexicon_Error;
struct Lexicon_Options;
struct Logger;
struct Phrase;
struct Reg_Exp;
enum struct Reg_Exp_Error_Code : Default_Underlying;
enum struct Reg_Exp_Flags : Default_Underlying;
enum struct Reg_Exp_Status : Default_Underlying;
enum struct Severity : Default_Underlying;
struct Token;
enum struct Token_Category : Default_Underlying;
enum struct Token_Kind : bool;

} // namespace titlecase

#endif
