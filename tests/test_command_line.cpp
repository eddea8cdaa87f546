/**
 * @file test_command_line.cpp
 * @brief Argument parsing, contradiction reports and parameter checks
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <gtest/gtest.h>

#include "cli/CommandLineInterface.hpp"
#include "cli/InputValidator.hpp"
#include "cli/SimpleCommandLineParser.hpp"
#include "export/ExporterRegistry.hpp"

#include <initializer_list>

using namespace pgexport;

namespace {

/// Owns argv storage for one parse call
class Argv {
public:
    Argv(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "pgexport");
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

class CommandLineTest : public ::testing::Test {
protected:
    CommandLineTest() { register_builtin_exporters(registry_); }

    /// Parse and validate, returning the validation message or "" on success
    std::string check(std::initializer_list<std::string> args) {
        Argv argv(args);
        CommandLineInterface cli;
        EXPECT_TRUE(cli.parse_arguments(argv.argc(), argv.argv()));
        try {
            cli.validate_parameters(registry_);
        } catch (const ConfigurationError& e) {
            return e.what();
        }
        return "";
    }

    ExporterRegistry registry_;
};

}  // namespace

TEST(SimpleCommandLineParserTest, ValuesFlagsAndDefaults) {
    SimpleCommandLineParser parser("tool", "test tool");
    parser.add_option("output", "o", "Output path", true);
    parser.add_option("format", "f", "Format", false, "csv");
    parser.add_option("offset", "", "Offset");
    parser.add_flag("quiet", "q", "Quiet");

    Argv argv({"-o", "out.csv", "--offset=-5", "-q"});
    ASSERT_TRUE(parser.parse(argv.argc(), argv.argv())) << parser.error();
    EXPECT_EQ(parser.get("output").value(), "out.csv");
    EXPECT_EQ(parser.get("format").value(), "csv");
    EXPECT_EQ(parser.get_as<int>("offset").value(), -5);
    EXPECT_TRUE(parser.get_flag("quiet"));
}

TEST(SimpleCommandLineParserTest, NegativeNumberIsAValue) {
    SimpleCommandLineParser parser("tool", "test tool");
    parser.add_option("offset", "", "Offset");
    Argv argv({"--offset", "-5"});
    ASSERT_TRUE(parser.parse(argv.argc(), argv.argv()));
    EXPECT_EQ(parser.get_as<int>("offset").value(), -5);
}

TEST(SimpleCommandLineParserTest, Errors) {
    SimpleCommandLineParser parser("tool", "test tool");
    parser.add_option("output", "o", "Output path", true);
    parser.add_flag("quiet", "q", "Quiet");

    Argv unknown({"--bogus"});
    EXPECT_FALSE(parser.parse(unknown.argc(), unknown.argv()));
    EXPECT_EQ(parser.error(), "Unknown option: --bogus");

    Argv missing_value({"--output"});
    EXPECT_FALSE(parser.parse(missing_value.argc(), missing_value.argv()));
    EXPECT_EQ(parser.error(), "Option --output requires a value");

    Argv flag_value({"-o", "x", "--quiet=yes"});
    EXPECT_FALSE(parser.parse(flag_value.argc(), flag_value.argv()));
    EXPECT_EQ(parser.error(), "Option --quiet does not take a value");

    Argv required({"-q"});
    EXPECT_FALSE(parser.parse(required.argc(), required.argv()));
    EXPECT_EQ(parser.error(), "Required option --output not provided");

    Argv help({"-q", "--help"});
    EXPECT_FALSE(parser.parse(help.argc(), help.argv()));
    EXPECT_TRUE(parser.help_requested());
    EXPECT_TRUE(parser.error().empty());
}

TEST(SimpleCommandLineParserTest, NonNumericValueIsRejected) {
    SimpleCommandLineParser parser("tool", "test tool");
    parser.add_option("port", "P", "Port");
    Argv argv({"-P", "54x"});
    ASSERT_TRUE(parser.parse(argv.argc(), argv.argv()));
    EXPECT_FALSE(parser.get_as<int>("port").has_value());
}

TEST_F(CommandLineTest, ParsesIntoConfig) {
    Argv argv({"-s", "SELECT 1", "-o", "out.json", "-f", " JSON ", "-z", "GZIP",
               "-H", "db", "-P", "6543", "-u", "me", "-d", "prod", "-p", "pw",
               "-T", "dd/MM/yyyy", "-Z", "UTC", "-x", "-q", "--log-level", "2,PgStore=5"});
    CommandLineInterface cli;
    ASSERT_TRUE(cli.parse_arguments(argv.argc(), argv.argv()));

    const CommandLineConfig& config = cli.get_config();
    EXPECT_EQ(config.sql, "SELECT 1");
    EXPECT_EQ(config.options.output_path, "out.json");
    EXPECT_EQ(config.options.format, "json");
    EXPECT_EQ(config.options.compression, "gzip");
    EXPECT_EQ(config.connection.host, "db");
    EXPECT_EQ(config.connection.port.value_or(0), 6543);
    EXPECT_EQ(config.connection.user, "me");
    EXPECT_EQ(config.connection.database, "prod");
    EXPECT_EQ(config.connection.password, "pw");
    EXPECT_EQ(config.options.time_format, "dd/MM/yyyy");
    EXPECT_EQ(config.options.time_zone, "UTC");
    EXPECT_TRUE(config.fail_on_empty);
    EXPECT_TRUE(config.quiet);
    EXPECT_EQ(config.log_level, "2,PgStore=5");
}

TEST_F(CommandLineTest, DefaultsWhenOmitted) {
    Argv argv({"-s", "SELECT 1", "-o", "out.csv"});
    CommandLineInterface cli;
    ASSERT_TRUE(cli.parse_arguments(argv.argc(), argv.argv()));

    const ExportOptions& options = cli.get_config().options;
    EXPECT_EQ(options.format, "csv");
    EXPECT_EQ(options.compression, "none");
    EXPECT_EQ(options.delimiter, ",");
    EXPECT_EQ(options.xml_root_element, "results");
    EXPECT_EQ(options.xml_row_element, "row");
    EXPECT_EQ(options.rows_per_statement, 1);
    EXPECT_EQ(options.time_format, "yyyy-MM-dd HH:mm:ss");
    EXPECT_TRUE(options.template_streaming);
    EXPECT_FALSE(cli.get_config().connection.port.has_value());
}

TEST_F(CommandLineTest, MalformedValuesThrow) {
    {
        Argv argv({"-o", "x", "-P", "abc"});
        CommandLineInterface cli;
        try {
            cli.parse_arguments(argv.argc(), argv.argv());
            FAIL() << "expected ConfigurationError";
        } catch (const ConfigurationError& e) {
            EXPECT_STREQ(e.what(), "invalid port 'abc'");
        }
    }
    {
        Argv argv({"-o", "x", "--insert-batch", "many"});
        CommandLineInterface cli;
        EXPECT_THROW(cli.parse_arguments(argv.argc(), argv.argv()), ConfigurationError);
    }
    {
        Argv argv({"-o", "x", "stray"});
        CommandLineInterface cli;
        try {
            cli.parse_arguments(argv.argc(), argv.argv());
            FAIL() << "expected ConfigurationError";
        } catch (const ConfigurationError& e) {
            EXPECT_STREQ(e.what(), "unexpected argument: stray");
        }
    }
    {
        Argv argv({"--frobnicate"});
        CommandLineInterface cli;
        EXPECT_THROW(cli.parse_arguments(argv.argc(), argv.argv()), ConfigurationError);
    }
}

TEST_F(CommandLineTest, HelpAndVersionStopEarly) {
    Argv help({"--help"});
    CommandLineInterface help_cli;
    EXPECT_FALSE(help_cli.parse_arguments(help.argc(), help.argv()));

    Argv version({"--version"});
    CommandLineInterface version_cli;
    EXPECT_FALSE(version_cli.parse_arguments(version.argc(), version.argv()));
}

TEST_F(CommandLineTest, ValidParameterSets) {
    EXPECT_EQ(check({"-s", "SELECT 1", "-o", "a.csv"}), "");
    EXPECT_EQ(check({"-s", "SELECT 1", "-o", "a.csv", "--with-copy", "-D", "\\t"}), "");
    EXPECT_EQ(check({"-s", "SELECT 1", "-o", "a.sql", "-f", "sql", "-t", "users", "--insert-batch", "100"}), "");
    EXPECT_EQ(check({"-s", "SELECT 1", "-o", "a.html", "-f", "template", "--tpl-file", "page.tpl"}), "");
    EXPECT_EQ(check({"-s", "SELECT 1", "-o", "a.html", "-f", "template", "--tpl-row", "row.tpl"}), "");
    EXPECT_EQ(check({"-F", "q.sql", "-o", "a.xlsx", "-f", "xlsx", "-z", "zip", "-Z", "UTC"}), "");
}

TEST_F(CommandLineTest, MissingInputs) {
    EXPECT_EQ(check({"-o", "a.csv"}), "Either --sql or --sqlfile must be provided");
    EXPECT_EQ(check({"-s", "SELECT 1"}), "--output (-o) is required");
}

TEST_F(CommandLineTest, FormatAndCompressionChecks) {
    EXPECT_EQ(check({"-s", "SELECT 1", "-o", "a", "-f", "parquet"}),
              "Invalid format 'parquet'. Valid formats are: csv, json, sql, template, xlsx, xml, yaml");
    EXPECT_EQ(check({"-s", "SELECT 1", "-o", "a", "-z", "rar"}),
              "Invalid compression 'rar'. Valid options are: none, gzip, zip, zstd, lz4");
    EXPECT_EQ(check({"-s", "SELECT 1", "-o", "a", "-D", ";;"}),
              "invalid delimiter: delimiter must be a single character, got \";;\"");
}

TEST_F(CommandLineTest, SqlFormatChecks) {
    EXPECT_EQ(check({"-s", "SELECT 1", "-o", "a", "-f", "sql"}), "--table (-t) is required when using SQL format");
    EXPECT_EQ(check({"-s", "SELECT 1", "-o", "a", "-f", "sql", "-t", "x", "--insert-batch", "0"}),
              "--insert-batch must be at least 1");
}

TEST_F(CommandLineTest, TemplateChecks) {
    EXPECT_EQ(check({"-s", "SELECT 1", "-o", "a", "-f", "template"}),
              "template format requires either --tpl-file (full mode) OR --tpl-row");
    EXPECT_EQ(check({"-s", "SELECT 1", "-o", "a", "-f", "template", "--tpl-header", "h.tpl"}),
              "template streaming mode requires --tpl-row to be specified");
}

TEST_F(CommandLineTest, TimeChecks) {
    EXPECT_EQ(check({"-s", "SELECT 1", "-o", "a", "-T", ""}),
              "Invalid time format ''. Use format like 'yyyy-MM-dd HH:mm:ss'");
    EXPECT_EQ(check({"-s", "SELECT 1", "-o", "a", "-Z", "Moon/Base"}),
              "Invalid timezone 'Moon/Base'. Use format like 'UTC' or 'Europe/Paris'");
}

TEST_F(CommandLineTest, ContradictionsAreReportedTogether) {
    std::string message = check({"-s", "SELECT 1", "-F", "q.sql", "-o", "a", "-v", "-q",
                                 "-f", "json", "--with-copy"});
    EXPECT_EQ(message.rfind("Contradictory parameters detected:\n\n", 0), 0u);
    EXPECT_NE(message.find("Conflict 1: Cannot use --verbose and --quiet flags together"), std::string::npos);
    EXPECT_NE(message.find("Conflict 2: Cannot use both --sql and --sqlfile at the same time"), std::string::npos);
    EXPECT_NE(message.find("Conflict 3: format json does not support COPY mode"), std::string::npos);
    EXPECT_NE(message.find("  Suggested solutions:\n    1. "), std::string::npos);
}

TEST(InputValidatorTest, TemplateModesConflict) {
    CommandLineConfig config;
    config.options.format = FORMAT_TEMPLATE;
    config.options.template_file = "full.tpl";
    config.options.template_row = "row.tpl";

    ValidationResult result = InputValidator().validate(config);
    ASSERT_TRUE(result.has_errors());
    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].description,
              "template export error: use either --tpl-file (full mode) OR --tpl-row (streaming mode), not both");
    EXPECT_EQ(result.conflicts[0].involved_params,
              (std::vector<std::string>{"--tpl-file = full.tpl", "--tpl-row = row.tpl"}));
}

TEST(InputValidatorTest, CleanConfigHasNoConflicts) {
    CommandLineConfig config;
    config.sql = "SELECT 1";
    config.with_copy = true;

    ValidationResult result = InputValidator().validate(config);
    EXPECT_FALSE(result.has_errors());
    EXPECT_EQ(result.format_error_message(), "");
}
