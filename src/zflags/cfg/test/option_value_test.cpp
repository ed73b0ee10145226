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

#include "zflags/cfg/option_value.hpp"
#include "zflags/cfg/error.hpp"
#include "zflags/error/error.hpp"
#include "zflags/log/buffer_logger.hpp"
#include "zflags/log/legacy_verbosity.hpp"
#include <gtest/gtest.h>
#include <boost/system/error_code.hpp>

namespace zflags::cfg::test
{

namespace
{
using log::Sev;
using log::verbose_sev;
using std::string;

/// Legacy_verbosity recording what it was told; optionally refusing everything.
class Fake_legacy_verbosity :
  public log::Legacy_verbosity
{
public:
  explicit Fake_legacy_verbosity(bool fail = false) :
    m_fail(fail),
    m_verbosity(0),
    m_set_count(0)
  {
  }

  void set_verbosity(unsigned int verbosity, Error_code* err_code) override
  {
    ASSERT_TRUE(err_code);
    ++m_set_count;
    if (m_fail)
    {
      *err_code = boost::system::errc::make_error_code(boost::system::errc::operation_not_permitted);
      return;
    }
    m_verbosity = verbosity;
    err_code->clear();
  }

  unsigned int verbosity() const override
  {
    return m_verbosity;
  }

  const bool m_fail;
  unsigned int m_verbosity;
  unsigned int m_set_count;
}; // class Fake_legacy_verbosity

const Error_code S_INVALID = error::Code::S_INVALID_VALUE;

} // Anonymous namespace

TEST(Option_value, Encoder)
{
  log::Buffer_logger logger(Sev::S_DEBUG);
  Encoder_value value(&logger);
  EXPECT_FALSE(value.is_set());
  EXPECT_EQ(value.str(), "");
  EXPECT_EQ(value.value(), Encoder_choice::S_JSON);
  EXPECT_EQ(value.type_name(), "encoder");
  EXPECT_FALSE(value.is_bool_flag());

  Error_code err_code;
  value.set("console", &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_TRUE(value.is_set());
  EXPECT_EQ(value.value(), Encoder_choice::S_CONSOLE);
  EXPECT_EQ(value.str(), "console");

  for (const string bad : { "JSON", "Console", "xml", "", " json" })
  {
    value.set(bad, &err_code);
    EXPECT_EQ(err_code, S_INVALID) << '[' << bad << ']';
    EXPECT_EQ(value.value(), Encoder_choice::S_CONSOLE) << '[' << bad << ']';
  }
  // Failures are logged.
  EXPECT_NE(logger.buffer_str().find("Unknown encoder [xml]"), string::npos) << logger.buffer_str();

  value.set("json");
  EXPECT_EQ(value.str(), "json");

  // Failure on a never-set cell leaves it unset.
  Encoder_value fresh;
  fresh.set("yaml", &err_code);
  EXPECT_EQ(err_code, S_INVALID);
  EXPECT_FALSE(fresh.is_set());
  EXPECT_EQ(fresh.str(), "");
} // TEST(Option_value, Encoder)

TEST(Option_value, Throwing)
{
  Encoder_value value;
  try
  {
    value.set("bogus");
    ADD_FAILURE() << "set() should have thrown.";
  }
  catch (const zflags::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), S_INVALID);
    EXPECT_EQ(exc.code().category().name(), string("zflags_cfg"));
  }
  EXPECT_FALSE(value.is_set());

  EXPECT_NO_THROW(value.set("console"));
  EXPECT_TRUE(value.is_set());
} // TEST(Option_value, Throwing)

TEST(Option_value, Level_names)
{
  Fake_legacy_verbosity legacy;
  Level_value value(&legacy);
  EXPECT_EQ(value.type_name(), "level");
  EXPECT_EQ(value.value(), Sev::S_INFO);
  EXPECT_FALSE(value.is_set());

  const std::pair<string, Sev> cases[] = { { "debug", Sev::S_DEBUG }, { "DEBUG", Sev::S_DEBUG },
                                           { "info", Sev::S_INFO }, { "Info", Sev::S_INFO },
                                           { "error", Sev::S_ERROR }, { "ErRoR", Sev::S_ERROR } };
  for (const auto& [text, sev] : cases)
  {
    Error_code err_code;
    value.set(text, &err_code);
    EXPECT_FALSE(err_code) << text;
    EXPECT_EQ(value.value(), sev) << text;
  }
  EXPECT_TRUE(value.is_set());
  // Named levels never touch the legacy verbosity.
  EXPECT_EQ(legacy.m_set_count, 0u);

  value.set("error");
  EXPECT_EQ(value.str(), "error");
  value.set("Debug");
  EXPECT_EQ(value.str(), "debug");
  value.set("INFO");
  EXPECT_EQ(value.str(), "info");
} // TEST(Option_value, Level_names)

TEST(Option_value, Level_numbers)
{
  Fake_legacy_verbosity legacy;
  Level_value value(&legacy);

  // 1 is debug; 2 and 3 are verbose without escalation.
  value.set("1");
  EXPECT_EQ(value.value(), Sev::S_DEBUG);
  value.set("2");
  EXPECT_EQ(value.value(), verbose_sev(2));
  EXPECT_EQ(value.str(), "2");
  value.set("3");
  EXPECT_EQ(value.value(), verbose_sev(3));
  EXPECT_EQ(legacy.m_set_count, 0u);

  // 4 and up also raise the legacy verbosity.
  value.set("4");
  EXPECT_EQ(value.value(), verbose_sev(4));
  EXPECT_EQ(legacy.m_set_count, 1u);
  EXPECT_EQ(legacy.m_verbosity, 4u);

  value.set("+10");
  EXPECT_EQ(value.value(), verbose_sev(10));
  EXPECT_EQ(value.str(), "10");
  EXPECT_EQ(legacy.m_verbosity, 10u);

  value.set("128");
  EXPECT_EQ(static_cast<int>(value.value()), -128);
  EXPECT_EQ(value.str(), "128");
  EXPECT_EQ(legacy.m_verbosity, 128u);
  EXPECT_EQ(legacy.m_set_count, 3u);

  // Beyond the most verbose Sev the threshold saturates, but the knob still gets the full N.
  for (const unsigned int big : { 129u, 200u, 1000u, 4000000000u })
  {
    const auto big_str = std::to_string(big);
    value.set(big_str);
    EXPECT_EQ(static_cast<int>(value.value()), -128) << big;
    EXPECT_EQ(value.str(), big_str);
    EXPECT_EQ(legacy.m_verbosity, big);
  }
  EXPECT_EQ(legacy.m_set_count, 7u);

  value.set("5");
  for (const string bad : { "0", "-1", "-3", "-5", "abc", "", "4x", " 4", "+", "warn", "1.5", "99999999999" })
  {
    Error_code err_code;
    value.set(bad, &err_code);
    EXPECT_EQ(err_code, S_INVALID) << '[' << bad << ']';
    EXPECT_EQ(value.value(), verbose_sev(5)) << '[' << bad << ']';
    EXPECT_EQ(value.str(), "5") << '[' << bad << ']';
  }
  EXPECT_EQ(legacy.m_set_count, 8u);
  EXPECT_EQ(legacy.m_verbosity, 5u);
} // TEST(Option_value, Level_numbers)

TEST(Option_value, Level_legacy_failure)
{
  Fake_legacy_verbosity legacy(true);
  Level_value value(&legacy);

  // No escalation needed: the failing knob is not consulted.
  value.set("3");
  EXPECT_EQ(value.value(), verbose_sev(3));

  Error_code err_code;
  value.set("5", &err_code);
  EXPECT_EQ(err_code, S_INVALID);
  EXPECT_EQ(legacy.m_set_count, 1u);
  EXPECT_EQ(value.value(), verbose_sev(3));
  EXPECT_EQ(value.str(), "3");

  Level_value fresh(&legacy);
  EXPECT_THROW(fresh.set("9"), zflags::error::Runtime_error);
  EXPECT_FALSE(fresh.is_set());
  EXPECT_EQ(fresh.value(), Sev::S_INFO);

  // The process-wide knob refuses verbosities it cannot represent.
  Level_value process_wide(&log::Process_legacy_verbosity::get_singleton());
  const auto saved = log::Process_legacy_verbosity::get_singleton().verbosity();
  process_wide.set("3000000000", &err_code);
  EXPECT_EQ(err_code, S_INVALID);
  EXPECT_FALSE(process_wide.is_set());
  EXPECT_EQ(log::Process_legacy_verbosity::get_singleton().verbosity(), saved);

  // Without any knob, escalation is skipped.
  Level_value unattached(nullptr);
  unattached.set("9", &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(unattached.value(), verbose_sev(9));
} // TEST(Option_value, Level_legacy_failure)

TEST(Option_value, Resolve_level)
{
  auto resolution = resolve_level("INFO");
  EXPECT_EQ(resolution.m_sev, Sev::S_INFO);
  EXPECT_FALSE(resolution.m_legacy_verbosity);

  resolution = resolve_level("3");
  EXPECT_EQ(resolution.m_sev, verbose_sev(3));
  EXPECT_FALSE(resolution.m_legacy_verbosity);

  resolution = resolve_level("4");
  EXPECT_EQ(resolution.m_sev, verbose_sev(4));
  ASSERT_TRUE(resolution.m_legacy_verbosity);
  EXPECT_EQ(*resolution.m_legacy_verbosity, 4u);

  resolution = resolve_level("300");
  EXPECT_EQ(static_cast<int>(resolution.m_sev), -128);
  EXPECT_EQ(resolution.m_verbosity, 300u);
  ASSERT_TRUE(resolution.m_legacy_verbosity);
  EXPECT_EQ(*resolution.m_legacy_verbosity, 300u);

  Error_code err_code;
  resolve_level("0", &err_code);
  EXPECT_EQ(err_code, S_INVALID);
  EXPECT_THROW(resolve_level("nope"), zflags::error::Runtime_error);
} // TEST(Option_value, Resolve_level)

TEST(Option_value, Sample_and_bool)
{
  Sample_value sample;
  EXPECT_EQ(sample.type_name(), "sample");
  EXPECT_TRUE(sample.is_bool_flag());
  EXPECT_FALSE(sample.value());
  EXPECT_EQ(sample.str(), "false");
  EXPECT_FALSE(sample.is_set());

  for (const string yes : { "1", "t", "T", "TRUE", "true", "True" })
  {
    sample.set("false");
    sample.set(yes);
    EXPECT_TRUE(sample.value()) << yes;
    EXPECT_EQ(sample.str(), "true");
  }
  for (const string no : { "0", "f", "F", "FALSE", "false", "False" })
  {
    sample.set("true");
    sample.set(no);
    EXPECT_FALSE(sample.value()) << no;
    EXPECT_EQ(sample.str(), "false");
  }
  for (const string bad : { "yes", "no", "", "tRUE", "2", "on" })
  {
    sample.set("true");
    Error_code err_code;
    sample.set(bad, &err_code);
    EXPECT_EQ(err_code, S_INVALID) << '[' << bad << ']';
    EXPECT_TRUE(sample.value()) << '[' << bad << ']';
  }

  Bool_value flag;
  EXPECT_EQ(flag.type_name(), "bool");
  EXPECT_TRUE(flag.is_bool_flag());
  EXPECT_FALSE(flag.value());
  flag.set("T");
  EXPECT_TRUE(flag.value());
  EXPECT_EQ(flag.str(), "true");

  Bool_value on_by_default(true);
  EXPECT_TRUE(on_by_default.value());
  EXPECT_FALSE(on_by_default.is_set());

  bool result = true;
  EXPECT_TRUE(parse_bool("0", &result));
  EXPECT_FALSE(result);
  EXPECT_FALSE(parse_bool("maybe", &result));
  EXPECT_FALSE(result);
} // TEST(Option_value, Sample_and_bool)

TEST(Option_value, Time_format)
{
  Time_format_value value;
  EXPECT_EQ(value.type_name(), "string");
  EXPECT_FALSE(value.is_bool_flag());
  EXPECT_EQ(value.value(), Time_format::S_UNIX);
  EXPECT_EQ(value.str(), "unix");

  value.set("iso8601");
  EXPECT_EQ(value.value(), Time_format::S_ISO8601);
  EXPECT_EQ(value.str(), "iso8601");
  value.set("unix");
  EXPECT_EQ(value.value(), Time_format::S_UNIX);

  // Too short to mean anything: silently the default.
  for (const string short_text : { "", "x", "i" })
  {
    value.set("iso8601");
    Error_code err_code;
    value.set(short_text, &err_code);
    EXPECT_FALSE(err_code) << '[' << short_text << ']';
    EXPECT_EQ(value.value(), Time_format::S_UNIX) << '[' << short_text << ']';
  }

  value.set("iso8601");
  for (const string bad : { "ISO8601", "Unix", "rfc3339", "xx" })
  {
    Error_code err_code;
    value.set(bad, &err_code);
    EXPECT_EQ(err_code, S_INVALID) << '[' << bad << ']';
    EXPECT_EQ(value.value(), Time_format::S_ISO8601) << '[' << bad << ']';
  }
} // TEST(Option_value, Time_format)

} // namespace zflags::cfg::test
