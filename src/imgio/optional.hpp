//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef IMGIO_OPTIONAL_HPP
#define IMGIO_OPTIONAL_HPP

#include <batteries/optional.hpp>

namespace imgio {

using ::batt::make_optional;
using ::batt::None;
using ::batt::NoneType;
using ::batt::Optional;

}  // namespace imgio

#endif  // IMGIO_OPTIONAL_HPP
