/*
* (C) 2014,2015 Jack Lloyd
*     2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_TESTS_H_
#define KEYWRAP_TESTS_H_

#include <keywrap/exceptn.h>
#include <keywrap/hex.h>
#include <keywrap/types.h>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <sstream>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Keywrap_Tests {

class Test_Error : public Keywrap::Exception {
   public:
      explicit Test_Error(const std::string& what) : Exception("Test error", what) {}
};

/**
* Thrown by test_failure when --abort-on-first-fail is set
*/
class Test_Aborted final : public Test_Error {
   public:
      explicit Test_Aborted(const std::string& what) : Test_Error(what) {}
};

struct Test_Options {
      std::vector<std::string> requested_tests;
      std::set<std::string> skip_tests;
      std::string data_dir;
      std::string drbg_seed;
      bool verbose = false;
      bool log_success = false;
      bool abort_on_first_fail = false;
};

/**
* Deterministic byte generator for randomized tests, seeded from the
* run seed and the test name. Not for cryptographic use.
*/
class Test_RNG final {
   public:
      Test_RNG(std::string_view seed, std::string_view test_name);

      void randomize(std::span<uint8_t> output);

      std::vector<uint8_t> random_vec(size_t len);

   private:
      uint8_t mix(uint8_t input = 0);

      uint64_t m_x = 0;
};

class Test {
   public:
      /*
      * Pass and failure counts for one subject, named by who()
      */
      class Result final {
         public:
            explicit Result(std::string who) : m_who(std::move(who)) {}

            static Result Failure(const std::string& who, const std::string& what) {
               Result r(who);
               r.test_failure(what);
               return r;
            }

            const std::string& who() const { return m_who; }

            size_t tests_passed() const { return m_tests_passed; }

            size_t tests_failed() const { return m_fail_log.size(); }

            size_t tests_run() const { return tests_passed() + tests_failed(); }

            void merge(const Result& other);

            std::string result_string() const;

            void test_note(const std::string& note, const char* extra = nullptr);

            void note_missing(const std::string& thing);

            bool test_success(const std::string& note = "");

            bool test_failure(const std::string& err);

            bool test_failure(const std::string& what, const std::string& error);

            bool confirm(const std::string& what, bool expr, bool expected = true) {
               return test_eq(what, expr, expected);
            }

            template <typename T>
            bool test_is_eq(const T& produced, const T& expected) {
               return test_is_eq("comparison", produced, expected);
            }

            template <typename T>
            bool test_is_eq(const std::string& what, const T& produced, const T& expected) {
               if(produced == expected) {
                  return test_success(what + " produced expected result");
               }

               std::ostringstream err;
               err << m_who << " " << what << " produced unexpected result '" << printable(produced)
                   << "' expected '" << printable(expected) << "'";
               return test_failure(err.str());
            }

            template <typename T>
            bool test_not_null(const std::string& what, const T& ptr) {
               if(ptr == nullptr) {
                  return test_failure(what + " was null");
               }
               return test_success(what + " was not null");
            }

            bool test_eq(const std::string& what, const char* produced, const char* expected);

            bool test_eq(const std::string& what, const std::string& produced, const std::string& expected);

            bool test_eq(const std::string& what, bool produced, bool expected);

            bool test_eq(const std::string& what, size_t produced, size_t expected);

            bool test_eq(const char* producer,
                         const std::string& what,
                         const uint8_t produced[],
                         size_t produced_len,
                         const uint8_t expected[],
                         size_t expected_len);

            bool test_eq(const std::string& what, std::span<const uint8_t> produced, std::span<const uint8_t> expected) {
               return test_eq(nullptr, what, produced.data(), produced.size(), expected.data(), expected.size());
            }

            bool test_eq(const std::string& what, std::span<const uint8_t> produced, const char* expected_hex) {
               const std::vector<uint8_t> expected = Keywrap::hex_decode(expected_hex);
               return test_eq(what, produced, std::span<const uint8_t>(expected));
            }

            bool test_ne(const std::string& what, std::span<const uint8_t> produced, std::span<const uint8_t> other);

            /**
            * Check the return code of a C API call
            */
            bool test_rc(const std::string& func, int expected, int rc);

            bool test_rc_ok(const std::string& func, int rc) { return test_rc(func, 0, rc); }

            bool test_all_zero(const std::string& what, std::span<const uint8_t> buf);

            /**
            * Passes if fn throws exactly ExceptionT, not a subclass of it
            */
            template <typename ExceptionT>
            bool test_throws(const std::string& what, const std::function<void()>& fn) {
               try {
                  fn();
               } catch(const std::exception& e) {
                  if(typeid(e) != typeid(ExceptionT)) {
                     return test_failure(what + " threw unexpected exception", e.what());
                  }
                  return test_success(what + " threw as expected");
               }
               return test_failure(what + " did not throw");
            }

            void start_timer();
            void end_timer();

            void add_ns_consumed(uint64_t ns) { m_ns_taken += ns; }

         private:
            // integers print as numbers, including uint8_t
            template <typename T>
            static auto printable(const T& v) {
               if constexpr(std::is_integral_v<T>) {
                  return std::to_string(v);
               } else {
                  return v;
               }
            }

            std::string m_who;
            uint64_t m_started = 0;
            uint64_t m_ns_taken = 0;
            size_t m_tests_passed = 0;
            std::vector<std::string> m_fail_log;
            std::vector<std::string> m_log;
      };

      virtual ~Test() = default;
      virtual std::vector<Test::Result> run() = 0;

      void set_test_name(const std::string& name) { m_test_name = name; }

      Test_RNG& rng() const;

      static void register_test(const std::string& category,
                                const std::string& name,
                                bool smoke_test,
                                std::function<std::unique_ptr<Test>()> maker_fn);

      static std::set<std::string> registered_tests();
      static std::set<std::string> registered_test_categories();

      /**
      * Resolve test and category names to test names. With no request
      * the smoke tests come first, then everything else.
      */
      static std::vector<std::string> filter_registered_tests(const std::vector<std::string>& requested,
                                                              const std::set<std::string>& to_be_skipped);

      static std::unique_ptr<Test> get_test(const std::string& test_name);

      static std::string data_file(const std::string& what);

      static std::string format_time(uint64_t nanoseconds);

      static void set_test_options(const Test_Options& opts);

      static void set_test_rng_seed(std::span<const uint8_t> seed);

      static const Test_Options& options() { return m_opts; }

      static uint64_t timestamp();

   private:
      static Test_Options m_opts;
      static std::string m_test_rng_seed;

      std::string m_test_name;
      mutable std::unique_ptr<Test_RNG> m_test_rng;
};

template <typename Test_Class>
class TestClassRegistration {
   public:
      TestClassRegistration(const std::string& category, const std::string& name, bool smoke_test) {
         Test::register_test(category, name, smoke_test, [=] {
            auto test = std::make_unique<Test_Class>();
            test->set_test_name(name);
            return test;
         });
      }
};

#define KEYWRAP_REGISTER_TEST(category, name, Test_Class) \
   const TestClassRegistration<Test_Class> reg_##Test_Class##_tests(category, name, false)
#define KEYWRAP_REGISTER_SMOKE_TEST(category, name, Test_Class) \
   const TestClassRegistration<Test_Class> reg_##Test_Class##_tests(category, name, true)

typedef Test::Result (*test_fn)();

/*
* A test made of free functions each returning one Result
*/
class FnTest final : public Test {
   public:
      explicit FnTest(std::vector<test_fn> fns) : m_fns(std::move(fns)) {}

      std::vector<Test::Result> run() override {
         std::vector<Test::Result> results;
         for(auto fn : m_fns) {
            results.push_back(fn());
         }
         return results;
      }

   private:
      std::vector<test_fn> m_fns;
};

class TestFnRegistration {
   public:
      TestFnRegistration(const std::string& category, const std::string& name, std::vector<test_fn> fns) {
         Test::register_test(category, name, false, [=] {
            auto test = std::make_unique<FnTest>(fns);
            test->set_test_name(name);
            return test;
         });
      }
};

#define KEYWRAP_TEST_CONCAT_IMPL(a, b) a##b
#define KEYWRAP_TEST_CONCAT(a, b) KEYWRAP_TEST_CONCAT_IMPL(a, b)

#define KEYWRAP_REGISTER_TEST_FN(category, name, ...) \
   static const TestFnRegistration KEYWRAP_TEST_CONCAT(reg_test_fn_, __LINE__)(category, name, {__VA_ARGS__})

class VarMap {
   public:
      void clear() { m_vars.clear(); }

      void add(const std::string& key, const std::string& value) { m_vars[key] = value; }

      bool has_key(const std::string& key) const { return m_vars.contains(key); }

      std::vector<uint8_t> get_req_bin(const std::string& key) const;

      std::string get_req_str(const std::string& key) const;

   private:
      std::unordered_map<std::string, std::string> m_vars;
};

/*
* A test driven by a file of key = value lines under the data directory.
* A line "[name]" starts a group and is passed as the header. The last
* required key triggers run_one_test. Blank lines and lines starting
* with '#' are skipped.
*
* run_final_tests runs once after the file, for checks that do not fit
* the vector format.
*/
class Text_Based_Test : public Test {
   public:
      Text_Based_Test(const std::string& input_file,
                      const std::string& required_keys,
                      const std::string& optional_keys = "");

      std::vector<Test::Result> run() override;

   protected:
      virtual Test::Result run_one_test(const std::string& header, const VarMap& vars) = 0;

      virtual std::vector<Test::Result> run_final_tests() { return std::vector<Test::Result>(); }

   private:
      std::string m_data_src;
      std::set<std::string> m_required_keys;
      std::set<std::string> m_optional_keys;
      std::string m_output_key;
};

}  // namespace Keywrap_Tests

#endif
