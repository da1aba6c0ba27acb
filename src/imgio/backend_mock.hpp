//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef IMGIO_BACKEND_MOCK_HPP
#define IMGIO_BACKEND_MOCK_HPP

#include <imgio/backend.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace imgio {

class BackendMock : public Backend
{
 public:
  MOCK_METHOD(std::string_view, name, (), (const, override));
  MOCK_METHOD(bool, readable, (), (const, override));
  MOCK_METHOD(bool, writable, (), (const, override));
  MOCK_METHOD(bool, sparse, (), (const, override));
  MOCK_METHOD(bool, dirty, (), (const, override));
  MOCK_METHOD(i64, block_size, (), (const, override));
  MOCK_METHOD(StatusOr<i64>, read_into, (const MutableBuffer& buffer), (override));
  MOCK_METHOD(StatusOr<i64>, write, (const ConstBuffer& data), (override));
  MOCK_METHOD(StatusOr<i64>, zero, (i64 count), (override));
  MOCK_METHOD(Status, seek, (i64 position), (override));
  MOCK_METHOD(i64, tell, (), (const, override));
  MOCK_METHOD(Status, flush, (), (override));
  MOCK_METHOD(StatusOr<i64>, size, (), (override));
  MOCK_METHOD(Status, close, (), (override));
};

}  // namespace imgio

#endif  // IMGIO_BACKEND_MOCK_HPP
