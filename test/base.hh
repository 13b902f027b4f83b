//
// Created by jason on 2021/9/15.
//

#pragma once

#include <gtest/gtest.h>

#include <functional>
#include <future>
#include <seastar/core/alien.hh>
#include <seastar/core/app-template.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/future.hh>
#include <seastar/core/reactor.hh>
#include <string>
#include <thread>
#include <vector>

#define VIGIL_TEST_(test_suite_name, test_name, parent_class, parent_id)       \
  static_assert(                                                               \
      sizeof(GTEST_STRINGIFY_(test_suite_name)) > 1,                           \
      "test_suite_name must not be empty");                                    \
  static_assert(                                                               \
      sizeof(GTEST_STRINGIFY_(test_name)) > 1, "test_name must not be empty"); \
  class GTEST_TEST_CLASS_NAME_(test_suite_name, test_name)                     \
    : public parent_class {                                                    \
   public:                                                                     \
    GTEST_TEST_CLASS_NAME_(test_suite_name, test_name)() = default;            \
    ~GTEST_TEST_CLASS_NAME_(test_suite_name, test_name)() override = default;  \
    GTEST_DISALLOW_COPY_AND_ASSIGN_(                                           \
        GTEST_TEST_CLASS_NAME_(test_suite_name, test_name));                   \
    GTEST_DISALLOW_MOVE_AND_ASSIGN_(                                           \
        GTEST_TEST_CLASS_NAME_(test_suite_name, test_name));                   \
                                                                               \
   private:                                                                    \
    void TestBody() override;                                                  \
    seastar::future<> SeastarBody();                                           \
    static ::testing::TestInfo* const test_info_ GTEST_ATTRIBUTE_UNUSED_;      \
  };                                                                           \
                                                                               \
  ::testing::TestInfo* const GTEST_TEST_CLASS_NAME_(                           \
      test_suite_name, test_name)::test_info_ =                                \
      ::testing::internal::MakeAndRegisterTestInfo(                            \
          #test_suite_name,                                                    \
          #test_name,                                                          \
          nullptr,                                                             \
          nullptr,                                                             \
          ::testing::internal::CodeLocation(__FILE__, __LINE__),               \
          (parent_id),                                                         \
          ::testing::internal::SuiteApiResolver<                               \
              parent_class>::GetSetUpCaseOrSuite(__FILE__, __LINE__),          \
          ::testing::internal::SuiteApiResolver<                               \
              parent_class>::GetTearDownCaseOrSuite(__FILE__, __LINE__),       \
          new ::testing::internal::TestFactoryImpl<GTEST_TEST_CLASS_NAME_(     \
              test_suite_name, test_name)>);                                   \
  void GTEST_TEST_CLASS_NAME_(test_suite_name, test_name)::TestBody() {        \
    ::vigil::test::base::run([this] { return this->SeastarBody(); });          \
  }                                                                            \
  seastar::future<> GTEST_TEST_CLASS_NAME_(                                    \
      test_suite_name, test_name)::SeastarBody()

#define VIGIL_TEST(test_suite_name, test_name)                                 \
  VIGIL_TEST_(                                                                 \
      test_suite_name,                                                         \
      test_name,                                                               \
      ::testing::Test,                                                         \
      ::testing::internal::GetTestTypeId())

#define VIGIL_TEST_F(test_fixture, test_name)                                  \
  VIGIL_TEST_(                                                                 \
      test_fixture,                                                            \
      test_name,                                                               \
      test_fixture,                                                            \
      ::testing::internal::GetTypeId<test_fixture>())

#ifdef GTEST_FATAL_FAILURE_
#undef GTEST_FATAL_FAILURE_
#endif

#define GTEST_FATAL_FAILURE_(message)                                          \
  co_return GTEST_MESSAGE_(message, ::testing::TestPartResult::kFatalFailure)

#ifdef GTEST_SKIP_
#undef GTEST_SKIP_
#endif

#define GTEST_SKIP_(message)                                                   \
  co_return GTEST_MESSAGE_(message, ::testing::TestPartResult::kSkip)

#define CASE_INDEX(i) "case " << ((i) + 1) << " failed"

namespace vigil::test {

// Owns the reactor of the test binary. The agent is single shard, so is
// the reactor, every test body runs on it as a coroutine while gtest
// blocks on the result.
class base : public ::testing::Environment {
 public:
  base(int argc, char** argv);

  void SetUp() override;

  void TearDown() override;

  // runs func on the reactor and rethrows its failure on the caller
  static void run(std::function<seastar::future<>()> func);

 private:
  std::vector<std::string> _args;
  std::vector<char*> _argv;
  std::thread _reactor;
  std::unique_ptr<seastar::app_template> _app;
};

extern seastar::logger l;

}  // namespace vigil::test
