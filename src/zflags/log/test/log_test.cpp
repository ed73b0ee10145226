/* zflags
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

#include "zflags/log/log.hpp"
#include "zflags/log/buffer_logger.hpp"
#include "zflags/log/config.hpp"
#include "zflags/log/encoder.hpp"
#include "zflags/log/legacy_verbosity.hpp"
#include "zflags/error/error.hpp"
#include "zflags/util/util.hpp"
#include <gtest/gtest.h>

namespace zflags::log::test
{

namespace
{
using std::string;

/// Buffer_logger emitting production-style JSON, so tests can look for exact substrings.
std::unique_ptr<Buffer_logger> make_json_logger(Sev threshold)
{
  return std::make_unique<Buffer_logger>(threshold,
                                         std::make_unique<Json_encoder>(Encoder_config::production()));
}

/// Log_context user, as any class using the ZFLAGS_LOG_*() macros would be.
class Chatty :
  public Log_context
{
public:
  explicit Chatty(Logger* logger_ptr) :
    Log_context(logger_ptr)
  {
  }

  void talk(int* evaluations)
  {
    ZFLAGS_LOG_INFO("info [" << ++(*evaluations) << ']');
    ZFLAGS_LOG_DEBUG("debug [" << ++(*evaluations) << ']');
    ZFLAGS_LOG_V(5, "verbose [" << ++(*evaluations) << ']');
    ZFLAGS_LOG_ERROR("error [" << ++(*evaluations) << ']');
  }
}; // class Chatty

} // Anonymous namespace

TEST(Log_sev, Names)
{
  EXPECT_EQ(sev_to_lower_str(Sev::S_DEBUG), "debug");
  EXPECT_EQ(sev_to_lower_str(Sev::S_INFO), "info");
  EXPECT_EQ(sev_to_lower_str(Sev::S_WARNING), "warn");
  EXPECT_EQ(sev_to_lower_str(Sev::S_ERROR), "error");
  EXPECT_EQ(sev_to_lower_str(Sev::S_DPANIC), "dpanic");
  EXPECT_EQ(sev_to_lower_str(Sev::S_PANIC), "panic");
  EXPECT_EQ(sev_to_lower_str(Sev::S_FATAL), "fatal");
  EXPECT_EQ(sev_to_lower_str(verbose_sev(5)), "Level(-5)");

  EXPECT_EQ(sev_to_capital_str(Sev::S_WARNING), "WARN");
  EXPECT_EQ(sev_to_capital_str(verbose_sev(5)), "LEVEL(-5)");

  EXPECT_EQ(util::ostream_op_string(Sev::S_ERROR), "error");
} // TEST(Log_sev, Names)

TEST(Log_sev, Ordering)
{
  static_assert(verbose_sev(1) == Sev::S_DEBUG);
  static_assert(static_cast<int>(verbose_sev(128)) == -128);

  EXPECT_TRUE(sev_passes(Sev::S_INFO, Sev::S_INFO));
  EXPECT_TRUE(sev_passes(Sev::S_ERROR, Sev::S_INFO));
  EXPECT_FALSE(sev_passes(Sev::S_DEBUG, Sev::S_INFO));
  EXPECT_TRUE(sev_passes(Sev::S_DEBUG, verbose_sev(4)));
  EXPECT_TRUE(sev_passes(verbose_sev(4), verbose_sev(4)));
  EXPECT_FALSE(sev_passes(verbose_sev(5), verbose_sev(4)));
} // TEST(Log_sev, Ordering)

TEST(Log_config, Verbosity)
{
  Config config;
  EXPECT_EQ(config.default_verbosity(), Config::S_MOST_VERBOSE_SEV_DEFAULT);
  EXPECT_TRUE(config.output_whether_should_log(Sev::S_INFO));
  EXPECT_FALSE(config.output_whether_should_log(Sev::S_DEBUG));

  config.configure_default_verbosity(verbose_sev(3));
  EXPECT_EQ(config.default_verbosity(), verbose_sev(3));
  EXPECT_TRUE(config.output_whether_should_log(verbose_sev(2)));
  EXPECT_TRUE(config.output_whether_should_log(verbose_sev(3)));
  EXPECT_FALSE(config.output_whether_should_log(verbose_sev(4)));
} // TEST(Log_config, Verbosity)

TEST(Log_context, Interface)
{
  using std::swap; // ADL-swap.

  Buffer_logger logger1;
  Buffer_logger logger2;

  Log_context ctx1;
  EXPECT_EQ(ctx1.get_logger(), nullptr);
  ctx1.set_logger(&logger2);
  EXPECT_EQ(ctx1.get_logger(), &logger2);
  ctx1 = Log_context{&logger1};
  EXPECT_EQ(ctx1.get_logger(), &logger1);

  Log_context ctx2{&logger2};
  EXPECT_EQ(ctx2.get_logger(), &logger2);

  swap(ctx1, ctx2);
  EXPECT_EQ(ctx1.get_logger(), &logger2);
  EXPECT_EQ(ctx2.get_logger(), &logger1);

  ctx1 = ctx2; // Copy-assign.
  EXPECT_EQ(ctx1.get_logger(), &logger1);
  EXPECT_EQ(ctx2.get_logger(), &logger1);

  ctx1 = Log_context{&logger2};
  ctx2 = std::move(ctx1); // Move-assign.
  EXPECT_EQ(ctx1.get_logger(), nullptr);
  EXPECT_EQ(ctx2.get_logger(), &logger2);

  Log_context ctx3{ctx2}; // Copy-ct.
  EXPECT_EQ(ctx3.get_logger(), &logger2);
  EXPECT_EQ(ctx2.get_logger(), &logger2);

  Log_context ctx4{std::move(ctx3)}; // Move-ct.
  EXPECT_EQ(ctx3.get_logger(), nullptr);
  EXPECT_EQ(ctx4.get_logger(), &logger2);
} // TEST(Log_context, Interface)

TEST(Log_macros, Filtering)
{
  const auto logger = make_json_logger(Sev::S_INFO);
  Chatty chatty(logger.get());

  // Fragments of filtered-out messages must not be evaluated.
  int evaluations = 0;
  chatty.talk(&evaluations);
  EXPECT_EQ(evaluations, 2);

  const auto& out = logger->buffer_str();
  EXPECT_NE(out.find("{\"level\":\"info\",\"ts\":"), string::npos) << out;
  EXPECT_NE(out.find("\"msg\":\"info [1]\"}\n"), string::npos) << out;
  EXPECT_NE(out.find("{\"level\":\"error\",\"ts\":"), string::npos) << out;
  EXPECT_NE(out.find("\"msg\":\"error [2]\"}\n"), string::npos) << out;
  EXPECT_EQ(out.find("debug"), string::npos) << out;
  EXPECT_EQ(out.find("verbose"), string::npos) << out;
  EXPECT_NE(out.find("\"caller\":\"log_test.cpp:"), string::npos) << out;

  // Lower the threshold on the fly.
  logger->buffer_clear();
  logger->m_config.configure_default_verbosity(verbose_sev(5));
  evaluations = 0;
  chatty.talk(&evaluations);
  EXPECT_EQ(evaluations, 4);
  EXPECT_NE(logger->buffer_str().find("{\"level\":\"Level(-5)\""), string::npos) << logger->buffer_str();
  EXPECT_NE(logger->buffer_str().find("\"msg\":\"verbose [3]\""), string::npos) << logger->buffer_str();

  // Null logger: nothing is evaluated, nothing happens.
  Chatty silent(nullptr);
  evaluations = 0;
  silent.talk(&evaluations);
  EXPECT_EQ(evaluations, 0);
} // TEST(Log_macros, Filtering)

TEST(Log_macros, Fields)
{
  const auto logger = make_json_logger(Sev::S_DEBUG);
  ZFLAGS_LOG_SET_LOGGER(logger.get());

  const string host = "example";
  ZFLAGS_LOG_WITH_FIELDS(Sev::S_INFO, "Connected to [" << host << "].",
                         make_field("host", host), make_field("port", 8080), make_field("secure", true),
                         make_field("ratio", 0.5));
  EXPECT_NE(logger->buffer_str().find("\"msg\":\"Connected to [example].\",\"host\":\"example\",\"port\":8080,"
                                      "\"secure\":true,\"ratio\":0.5}\n"),
            string::npos) << logger->buffer_str();

  // Filtered out: fields are not even built.
  logger->buffer_clear();
  int evaluations = 0;
  ZFLAGS_LOG_WITH_FIELDS(verbose_sev(2), "hidden", make_field("n", ++evaluations));
  EXPECT_EQ(evaluations, 0);
  EXPECT_TRUE(logger->buffer_str().empty());
} // TEST(Log_macros, Fields)

TEST(Log_legacy_verbosity, Process)
{
  auto& legacy = Process_legacy_verbosity::get_singleton();
  EXPECT_EQ(&legacy, &(Process_legacy_verbosity::get_singleton()));

  const auto saved = legacy.verbosity();

  legacy.set_verbosity(7);
  EXPECT_EQ(legacy.verbosity(), 7u);

  Error_code err_code;
  legacy.set_verbosity(Process_legacy_verbosity::S_MAX_VERBOSITY + 1u, &err_code);
  EXPECT_EQ(err_code, boost::system::errc::make_error_code(boost::system::errc::invalid_argument));
  EXPECT_EQ(legacy.verbosity(), 7u);

  EXPECT_THROW(legacy.set_verbosity(Process_legacy_verbosity::S_MAX_VERBOSITY + 1u), error::Runtime_error);
  EXPECT_EQ(legacy.verbosity(), 7u);

  legacy.set_verbosity(saved);
} // TEST(Log_legacy_verbosity, Process)

} // namespace zflags::log::test
