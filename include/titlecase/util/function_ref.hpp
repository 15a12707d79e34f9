#ifndef TITLECASE_FUNCTION_REF_HPP
#define TITLECASE_FUNCTION_REF_HPP

#include "ulight/function_ref.hpp"

namespace titlecase {

template <typename F>
using Function_Ref = ulight::Function_Ref<F>;

} // namespace titlecase

#endif
