#include <gtest/gtest.h>

#include <stdexcept>

#include "gcode_checker.hh"
#include "test_helpers.hh"

using namespace GCodeCheck;
using GCodeCheckTest::countMessage;
using GCodeCheckTest::findMessage;
using GCodeCheckTest::TempDir;

TEST(GCodeChecker, CleanProgramPasses)
{
  TempDir dir;
  std::string path = dir.write("main.nc",
                               "%\n"
                               "O1000 (pocket)\n"
                               "G00 X0 Y0 Z5\n"
                               "M03 S12000\n"
                               "G01 Z-2 F300\n"
                               "G01 X40 Y0\n"
                               "G02 X40 Y20 R10\n"
                               "G00 Z5\n"
                               "M05\n"
                               "M30\n"
                               "%\n");

  CheckReport report = checkFile(path, CheckerConfig());

  EXPECT_TRUE(report.issues.empty());
  EXPECT_TRUE(report.passed);
  EXPECT_EQ(report.positions.size(), 5u);
  EXPECT_DOUBLE_EQ(report.travel.x.max, 40);
  EXPECT_DOUBLE_EQ(report.travel.y.max, 20);
  EXPECT_DOUBLE_EQ(report.travel.z.min, -2);
  EXPECT_EQ(report.counts.lines, 11u);
  EXPECT_EQ(report.counts.blocks, 9u);
  EXPECT_EQ(report.counts.arcMoves, 1u);
  EXPECT_EQ(report.structure.terminators, (std::vector<std::string>{"M30"}));
}

TEST(GCodeChecker, ErrorsFailWarningsDoNot)
{
  TempDir dir;
  std::string warnOnly = dir.write("warn.nc", "G01 X1 F20000\n");
  std::string withError = dir.write("error.nc", "G01 X1 F0\nG01 X2 F20000\n");

  CheckReport pass = checkFile(warnOnly, CheckerConfig());
  EXPECT_TRUE(pass.passed);
  EXPECT_EQ(pass.warningCount, 1u);

  CheckReport fail = checkFile(withError, CheckerConfig());
  EXPECT_FALSE(fail.passed);
  EXPECT_EQ(fail.errorCount, 1u);
  EXPECT_EQ(fail.warningCount, 1u);
}

TEST(GCodeChecker, MissingMainFileThrows)
{
  TempDir dir;
  EXPECT_THROW(checkFile((dir.path() / "nope.nc").string(), CheckerConfig()), std::runtime_error);
}

TEST(GCodeChecker, MissingSubprogramIsSingleWarning)
{
  TempDir dir;
  std::string path = dir.write("main.nc",
                               "O1000\n"
                               "G00 X0 Y0\n"
                               "M98 P2000\n"
                               "M30\n");

  CheckReport report = checkFile(path, CheckerConfig());

  ASSERT_EQ(report.issues.size(), 1u);
  EXPECT_EQ(report.issues[0].severity, Severity::WARNING);
  EXPECT_EQ(report.issues[0].message, "subprogram P2000 called but not defined");
  EXPECT_EQ(report.issues[0].file, "main.nc");
  EXPECT_EQ(report.issues[0].lineNumber, 3);
  EXPECT_TRUE(report.root.subprograms.empty());
  EXPECT_TRUE(report.passed);
}

TEST(GCodeChecker, SubprogramFileIsMerged)
{
  TempDir dir;
  std::string path = dir.write("main.nc",
                               "O1000\n"
                               "G00 X10 Y10\n"
                               "M98 P2000\n"
                               "M30\n");
  dir.write("O2000.nc",
            "O2000\n"
            "G01 X300 Y-20 F0\n"
            "G01 Z-5\n"
            "M99\n");

  CheckReport report = checkFile(path, CheckerConfig());

  ASSERT_EQ(report.root.subprograms.size(), 1u);
  EXPECT_EQ(report.root.subprograms[0].programNumber, 2000);
  EXPECT_EQ(report.root.subprograms[0].file, "O2000.nc");

  EXPECT_DOUBLE_EQ(report.travel.x.min, 10);
  EXPECT_DOUBLE_EQ(report.travel.x.max, 300);
  EXPECT_DOUBLE_EQ(report.travel.y.min, -20);
  EXPECT_DOUBLE_EQ(report.travel.y.max, 10);
  EXPECT_DOUBLE_EQ(report.travel.z.min, -5);

  const Issue *feed = findMessage(report.issues, "feed rate must be positive (F0)");
  ASSERT_NE(feed, nullptr);
  EXPECT_EQ(feed->severity, Severity::ERROR);
  EXPECT_EQ(feed->file, "O2000.nc");
  EXPECT_EQ(feed->lineNumber, 2);

  EXPECT_EQ(countMessage(report.issues, "subprogram P2000 called but not defined"), 0u);
  EXPECT_FALSE(report.passed);
  EXPECT_EQ(report.files, (std::vector<std::string>{"main.nc", "O2000.nc"}));
  // Position history is the main program's own path
  EXPECT_EQ(report.positions.size(), 1u);
}

TEST(GCodeChecker, NestedSubprogramsResolveFromTheirDirectory)
{
  TempDir dir;
  std::string path = dir.write("main.nc", "M98 P2000\nM30\n");
  dir.write("o2000.txt", "M98 P3000\nM99\n");
  dir.write("3000.nc", "G00 Z-40\nM99\n");

  CheckReport report = checkFile(path, CheckerConfig());

  EXPECT_EQ(report.files, (std::vector<std::string>{"main.nc", "o2000.txt", "3000.nc"}));
  EXPECT_DOUBLE_EQ(report.travel.z.min, -40);
  EXPECT_TRUE(report.issues.empty());
}

TEST(GCodeChecker, CircularReferenceTerminates)
{
  TempDir dir;
  std::string path = dir.write("O1000.nc", "O1000\nM98 P2000\nM30\n");
  dir.write("O2000.nc", "O2000\nM98 P1000\nM99\n");

  CheckReport report = checkFile(path, CheckerConfig());

  const Issue *cycle = findMessage(report.issues, "circular subprogram reference P1000 (O1000.nc)");
  ASSERT_NE(cycle, nullptr);
  EXPECT_EQ(cycle->severity, Severity::WARNING);
  EXPECT_EQ(cycle->file, "O2000.nc");
  EXPECT_EQ(cycle->lineNumber, 2);
  EXPECT_EQ(report.files.size(), 2u);
  EXPECT_TRUE(report.passed);
}

TEST(GCodeChecker, SharedSubprogramIsAnalyzedOnce)
{
  TempDir dir;
  std::string path = dir.write("main.nc", "M98 P2000\nM98 P3000\nM30\n");
  dir.write("O2000.nc", "M98 P4000\nM99\n");
  dir.write("O3000.nc", "M98 P4000\nM99\n");
  dir.write("O4000.nc", "G01 X1 F-1\nM99\n");

  CheckReport report = checkFile(path, CheckerConfig());

  EXPECT_EQ(report.files, (std::vector<std::string>{"main.nc", "O2000.nc", "O4000.nc", "O3000.nc"}));
  EXPECT_EQ(report.errorCount, 1u);
  EXPECT_EQ(countMessage(report.issues, "subprogram P4000 called but not defined"), 0u);
}

TEST(GCodeChecker, LocalSubprogramNeedsNoFile)
{
  TempDir dir;
  std::string path = dir.write("main.nc",
                               "O1000\n"
                               "M98 P3000\n"
                               "M30\n"
                               "O3000\n"
                               "G01 X5 F100\n"
                               "M99\n"
                               "O4000\n"
                               "G01 X6 F100\n"
                               "M99\n");

  CheckReport report = checkFile(path, CheckerConfig());

  ASSERT_EQ(report.issues.size(), 1u);
  EXPECT_EQ(report.issues[0].message, "subprogram O4000 defined but never called");
  EXPECT_EQ(report.issues[0].lineNumber, 7);
  EXPECT_TRUE(report.root.subprograms.empty());
  EXPECT_EQ(report.structure.returns.size(), 2u);
}

TEST(GCodeChecker, UnusualExtensionIsWarning)
{
  TempDir dir;
  std::string path = dir.write("program.xyz", "G00 X1\n");

  CheckReport report = checkFile(path, CheckerConfig());

  ASSERT_EQ(report.issues.size(), 1u);
  EXPECT_EQ(report.issues[0].message, "File extension '.xyz' may not be standard G-code format");
  EXPECT_EQ(report.issues[0].lineNumber, 0);

  std::string upper = dir.write("PROGRAM.NC", "G00 X1\n");
  EXPECT_TRUE(checkFile(upper, CheckerConfig()).issues.empty());
}

TEST(GCodeChecker, UndecodableBytesAreSkipped)
{
  TempDir dir;
  std::string path = dir.write("latin1.nc", "(Fr\xe4sen)\nG01 X1\xff Y2 F100\n");

  CheckReport report = checkFile(path, CheckerConfig());

  EXPECT_TRUE(report.issues.empty());
  ASSERT_EQ(report.positions.size(), 1u);
  EXPECT_EQ(report.positions[0], (Position3{1, 2, 0}));
}

TEST(GCodeChecker, IssuesKeepSourceLineNumbers)
{
  auto result = analyzeLines({"G00 X0", "", "; note", "G01 X1 F-5", "Q1"}, "mem.nc", CheckerConfig());

  ASSERT_EQ(result.issues.size(), 2u);
  EXPECT_EQ(result.issues[0].lineNumber, 4);
  EXPECT_EQ(result.issues[0].file, "mem.nc");
  EXPECT_EQ(result.issues[1].lineNumber, 5);
  EXPECT_EQ(result.issues[1].message, "Invalid command format: Q1");
  EXPECT_EQ(result.counts.lines, 4u);
  EXPECT_EQ(result.counts.blocks, 3u);
}

TEST(GCodeChecker, ReportsProgress)
{
  std::vector<std::string> lines(120, "G01 X1 F100");
  std::vector<CheckProgress> reports;

  analyzeLines(lines, "long.nc", CheckerConfig(), [&](const CheckProgress &p)
               { reports.push_back(p); });

  ASSERT_EQ(reports.size(), 3u);
  EXPECT_EQ(reports[0].linesRead, 50u);
  EXPECT_EQ(reports[1].linesRead, 100u);
  EXPECT_EQ(reports.back().linesRead, 120u);
  EXPECT_DOUBLE_EQ(reports.back().percent, 100.0);
}

TEST(GCodeChecker, RepeatedRunsAreIdentical)
{
  TempDir dir;
  std::string path = dir.write("main.nc",
                               "O1000\n"
                               "G00 X0 Y0\n"
                               "M98 P2000\n"
                               "M98 P5000\n"
                               "G17 G01 X2000 F-3\n"
                               "M30\n");
  dir.write("O2000.nc", "G02 X10 Y10\nZ-3\nM99\n");

  CheckReport first = checkFile(path, CheckerConfig());
  CheckReport second = checkFile(path, CheckerConfig());

  EXPECT_TRUE(first.root == second.root);
  EXPECT_EQ(first.issues, second.issues);
  EXPECT_EQ(first.positions, second.positions);
  EXPECT_TRUE(first.travel == second.travel);
  EXPECT_TRUE(first.structure == second.structure);
  EXPECT_EQ(first.passed, second.passed);
}
