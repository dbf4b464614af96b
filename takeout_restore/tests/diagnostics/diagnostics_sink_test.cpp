#include "diagnostics/diagnostics_sink.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace takeoutrestore {
TEST(DiagnosticsSinkTests, ParseLevelTest) {
  EXPECT_EQ(ParseLevel("debug"), DiagnosticLevel::DEBUG);
  EXPECT_EQ(ParseLevel("INFO"), DiagnosticLevel::INFO);
  EXPECT_EQ(ParseLevel("Warn"), DiagnosticLevel::WARNING);
  EXPECT_EQ(ParseLevel("warning"), DiagnosticLevel::WARNING);
  EXPECT_EQ(ParseLevel("ERROR"), DiagnosticLevel::ERROR);
  EXPECT_THROW(ParseLevel("verbose"), std::invalid_argument);
  EXPECT_THROW(ParseLevel(""), std::invalid_argument);
}

TEST(DiagnosticsSinkTests, StreamSinkFiltersByLevelTest) {
  std::ostringstream    out;
  StreamDiagnosticsSink sink(out, DiagnosticLevel::WARNING);

  sink.Debug("hidden");
  sink.Info("hidden too");
  sink.Warning("no sidecar found", "album/IMG_1.jpg");
  sink.Error("write failed");

  EXPECT_EQ(out.str(),
            "[WARNING] no sidecar found (album/IMG_1.jpg)\n"
            "[ERROR] write failed\n");

  sink.SetMinLevel(DiagnosticLevel::DEBUG);
  sink.Debug("now visible");
  EXPECT_NE(out.str().find("[DEBUG] now visible"), std::string::npos);
}

TEST(DiagnosticsSinkTests, TeeSinkForwardsToAllTest) {
  auto               first  = std::make_shared<CollectingDiagnosticsSink>();
  auto               second = std::make_shared<CollectingDiagnosticsSink>();
  TeeDiagnosticsSink tee;
  tee.AddSink(first);
  tee.AddSink(second);

  tee.Report({DiagnosticLevel::WARNING, DiagnosticKind::NO_MATCH, "IMG_1.jpg", "no sidecar"});
  tee.Info("done");

  EXPECT_EQ(first->Snapshot().size(), 2u);
  EXPECT_EQ(second->CountOf(DiagnosticKind::NO_MATCH), 1u);
  EXPECT_EQ(second->CountOf(DiagnosticKind::GENERAL), 1u);
}

TEST(DiagnosticsSinkTests, CollectingSinkKeepsOrderTest) {
  CollectingDiagnosticsSink sink;
  sink.Info("first");
  sink.Report({DiagnosticLevel::ERROR, DiagnosticKind::INJECTION_FAILED, "IMG_1.jpg", "second"});
  sink.Warning("third");

  auto snapshot = sink.Snapshot();
  ASSERT_EQ(snapshot.size(), 3u);
  EXPECT_EQ(snapshot[0].message_, "first");
  EXPECT_EQ(snapshot[1].kind_, DiagnosticKind::INJECTION_FAILED);
  EXPECT_EQ(snapshot[1].path_, "IMG_1.jpg");
  EXPECT_EQ(snapshot[2].level_, DiagnosticLevel::WARNING);

  sink.Clear();
  EXPECT_TRUE(sink.Snapshot().empty());
}

TEST(DiagnosticsSinkTests, CollectingSinkIsThreadSafeTest) {
  CollectingDiagnosticsSink sink;
  std::vector<std::thread>  threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&sink] {
      for (int i = 0; i < 250; ++i) {
        sink.Report({DiagnosticLevel::DEBUG, DiagnosticKind::MATCHED, {}, "matched"});
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(sink.CountOf(DiagnosticKind::MATCHED), 2000u);
}

TEST(DiagnosticsSinkTests, KindNamesTest) {
  EXPECT_STREQ(KindToString(DiagnosticKind::AMBIGUOUS_MATCH), "ambiguous-match");
  EXPECT_STREQ(KindToString(DiagnosticKind::UNCONSUMED_SIDECAR), "unconsumed-sidecar");
  EXPECT_STREQ(LevelToString(DiagnosticLevel::WARNING), "WARNING");
}
};  // namespace takeoutrestore
