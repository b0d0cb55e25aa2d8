/**
 * @file test_test_logger.cpp
 * @brief Unit Tests for the indentation-aware test logger
 *
 * © 2025 Uni-Libraries contributors — MIT License
 */

#include <catch2/catch_test_macros.hpp>

#include "valsim_harness/test_logger.hpp"

#include <sstream>
#include <string>
#include <utility>

using namespace valsim::harness;

TEST_CASE("TestLogger frames a phase with start and result lines", "[test_logger]")
{
    std::ostringstream out;
    TestLogger log(out);

    log.teststart("dir/case1", "prepare");
    REQUIRE(log.indent_level() == 1);
    log.writeline("copying input");
    log.testresult("dir/case1", "prepare", PhaseStatus::Error, "boom\nsecond line");
    REQUIRE(log.indent_level() == 0);

    REQUIRE(out.str() ==
            "dir/case1:\tprepare:\tstarted...\n"
            "  copying input\n"
            "dir/case1:\tprepare:\tError\n"
            "  boom\n"
            "  second line\n");
}

TEST_CASE("TestLogger write splits lines and drops one trailing newline", "[test_logger]")
{
    std::ostringstream out;
    TestLogger log(out);
    log.increase_indent();
    log.write("a\nb\n");
    REQUIRE(out.str() == "  a\n  b\n");
}

TEST_CASE("TestLogger never indents below zero", "[test_logger]")
{
    std::ostringstream out;
    TestLogger log(out);
    log.decrease_indent();
    log.block_close();
    REQUIRE(log.indent_level() == 0);
    log.writeline("x");
    REQUIRE(out.str() == "x\n");
}

TEST_CASE("TestLogger summary rows and banners", "[test_logger]")
{
    std::ostringstream out;
    TestLogger log(out);

    SECTION("summary row uses fixed columns")
    {
        log.testsummary("case", PhaseStatus::Ok, PhaseStatus::Failed, PhaseStatus::NotRun);
        const std::string expected = std::string("case") + std::string(36, ' ') + " " + "OK" +
                                     std::string(10, ' ') + " " + "FAILED" + std::string(6, ' ') + " " +
                                     "Not run" + std::string(5, ' ') + "\n";
        REQUIRE(out.str() == expected);
    }

    SECTION("header banner")
    {
        log.testheader("case");
        const std::string rule(80, '=');
        REQUIRE(out.str() == rule + "\n==  case\n" + rule + "\n");
    }
}

TEST_CASE("TestLogger success and failure marks end at the result column", "[test_logger]")
{
    std::ostringstream out;
    TestLogger log(out);
    log.testsuccess("energy");
    log.testfailure("forces");

    std::istringstream lines(out.str());
    std::string first;
    std::string second;
    std::getline(lines, first);
    std::getline(lines, second);
    REQUIRE(first == "energy" + std::string(72 - 6, ' ') + "[Ok]");
    REQUIRE(second == "forces" + std::string(72 - 6, ' ') + "[FAILED]");
}

TEST_CASE("Buffered TestLogger drains its text", "[test_logger]")
{
    TestLogger log;
    REQUIRE(log.buffered());
    log.writeline("one");
    REQUIRE(log.take_buffer() == "one\n");
    REQUIRE(log.take_buffer().empty());
    log.writeline("two");

    TestLogger moved(std::move(log));
    REQUIRE(moved.take_buffer() == "two\n");
}

TEST_CASE("TestLogger breaks long messages to the line width", "[test_logger]")
{
    std::ostringstream out;
    TestLogger log(out);
    log.writeline(std::string(100, 'x'), true);

    std::istringstream lines(out.str());
    std::string first;
    std::string second;
    std::getline(lines, first);
    std::getline(lines, second);
    REQUIRE(first.size() == 80);
    REQUIRE(second.size() == 20);
}
