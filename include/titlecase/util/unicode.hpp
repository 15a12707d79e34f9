#ifndef TITLECASE_UNICODE_HPP
#define TITLECASE_UNICODE_HPP

#include "ulight/impl/unicode.hpp"
#include "ulight/impl/unicode_algorithm.hpp"

namespace titlecase::utf8 {

using ulight::utf8::Code_Point_And_Length;
using ulight::utf8::Code_Point_View;
using ulight::utf8::Code_Units_And_Length;
using ulight::utf8::decode_and_length_or_replacement;
using ulight::utf8::decode_unchecked;
using ulight::utf8::encode8_unchecked;
using ulight::utf8::is_valid;
using ulight::utf8::sequence_length;

} // namespace titlecase::utf8

#endif
