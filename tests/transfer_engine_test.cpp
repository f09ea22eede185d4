#include "test_utils.hpp"
#include "transfer_engine.hpp"
#include "metadata_store.hpp"
#include "filesystem/checksum.hpp"
#include "transfer/errors.hpp"
#include <algorithm>
#include <mutex>
#include <set>

using testutils::TempDirTest;
using testutils::read_file;
using testutils::write_file;
using transfer::OperationKind;

namespace fs = std::filesystem;

class TransferEngineTest : public TempDirTest {
protected:
    fs::path source_;
    fs::path dest_;

    void SetUp() override {
        TempDirTest::SetUp();
        source_ = root_ / "downloads";
        dest_ = root_ / "library";
        fs::create_directories(source_);
    }

    transfer::TransferGroup alpha() const {
        return {"Alpha", "Anime", std::nullopt, {"Alpha_E01.mkv", "Alpha_E02.mkv"}};
    }

    void create_alpha_sources() {
        write_file(source_ / "Alpha_E01.mkv", testutils::payload(300000, 1));
        write_file(source_ / "Alpha_E02.mkv", testutils::payload(150000, 2));
    }
};

TEST_F(TransferEngineTest, CopyGroupIntoCategoryTree) {
    create_alpha_sources();
    TransferEngine engine;

    transfer::TransferReport report = engine.transfer({alpha()}, source_, dest_, OperationKind::COPY, true);

    fs::path group_dir = dest_ / "Anime" / "Alpha";
    EXPECT_TRUE(fs::exists(group_dir / "Alpha_E01.mkv"));
    EXPECT_TRUE(fs::exists(group_dir / "Alpha_E02.mkv"));
    EXPECT_TRUE(fs::exists(source_ / "Alpha_E01.mkv"));
    EXPECT_TRUE(fs::exists(source_ / "Alpha_E02.mkv"));
    EXPECT_TRUE(report.failures.empty());

    auto sidecar = metadata::load(group_dir);
    ASSERT_TRUE(sidecar.has_value());
    EXPECT_EQ(sidecar->name, "Alpha");
    EXPECT_EQ(sidecar->category, "Anime");
    EXPECT_FALSE(sidecar->is_series);
    EXPECT_EQ(sidecar->operation, OperationKind::COPY);
    ASSERT_EQ(sidecar->files.size(), 2u);
    for (const auto& [name, file] : sidecar->files) {
        ASSERT_TRUE(file.md5.has_value());
        ASSERT_TRUE(file.sha256.has_value());
        EXPECT_FALSE(file.md5->empty());
        fsutils::Digests actual = fsutils::hash_file(group_dir / name);
        EXPECT_EQ(*file.md5, actual.md5);
        EXPECT_EQ(*file.sha256, actual.sha256);
    }

    ASSERT_EQ(report.summaries.size(), 1u);
    EXPECT_EQ(report.summaries[0].state, transfer::GroupState::COMPLETED);
    EXPECT_EQ(report.summaries[0].bytes_planned, 450000u);
    ASSERT_EQ(report.groups.size(), 1u);
    EXPECT_EQ(report.groups[0], *sidecar);
}

TEST_F(TransferEngineTest, MoveGroupEmptiesSource) {
    create_alpha_sources();
    auto e01_size = fs::file_size(source_ / "Alpha_E01.mkv");
    auto e02_size = fs::file_size(source_ / "Alpha_E02.mkv");
    TransferEngine engine;

    transfer::TransferReport report = engine.transfer({alpha()}, source_, dest_, OperationKind::MOVE, true);

    fs::path group_dir = dest_ / "Anime" / "Alpha";
    EXPECT_FALSE(fs::exists(source_ / "Alpha_E01.mkv"));
    EXPECT_FALSE(fs::exists(source_ / "Alpha_E02.mkv"));
    EXPECT_EQ(fs::file_size(group_dir / "Alpha_E01.mkv"), e01_size);
    EXPECT_EQ(fs::file_size(group_dir / "Alpha_E02.mkv"), e02_size);
    EXPECT_TRUE(report.failures.empty());

    auto sidecar = metadata::load(group_dir);
    ASSERT_TRUE(sidecar.has_value());
    EXPECT_EQ(sidecar->operation, OperationKind::MOVE);
    for (const auto& [name, file] : sidecar->files) {
        EXPECT_EQ(*file.sha256, fsutils::hash_file(group_dir / name).sha256);
    }
}

TEST_F(TransferEngineTest, MissingFileIsIsolated) {
    write_file(source_ / "Gamma_1.mkv", "one");
    write_file(source_ / "Gamma_3.mkv", "three");
    transfer::TransferGroup gamma{"Gamma", "Korean archive", std::nullopt,
                                  {"Gamma_1.mkv", "Gamma_2.mkv", "Gamma_3.mkv"}};
    TransferEngine engine;

    transfer::TransferReport report = engine.transfer({gamma}, source_, dest_, OperationKind::COPY, true);

    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].filename, "Gamma_2.mkv");
    EXPECT_EQ(report.failures[0].group, "Gamma");
    EXPECT_EQ(report.failures[0].kind, transfer::ErrorKind::NOT_FOUND);
    ASSERT_EQ(report.groups.size(), 1u);
    EXPECT_EQ(report.groups[0].files.size(), 2u);
    EXPECT_EQ(report.summaries[0].state, transfer::GroupState::PARTIALLY_FAILED);

    auto sidecar = metadata::load(dest_ / "Korean archive" / "Gamma");
    ASSERT_TRUE(sidecar.has_value());
    EXPECT_EQ(sidecar->files.size(), 2u);
    EXPECT_EQ(sidecar->files.count("Gamma_1.mkv"), 1u);
    EXPECT_EQ(sidecar->files.count("Gamma_3.mkv"), 1u);
    EXPECT_EQ(sidecar->files.count("Gamma_2.mkv"), 0u);
}

TEST_F(TransferEngineTest, EveryFileIsEitherRecordedOrFailed) {
    write_file(source_ / "a.mkv", "a");
    write_file(source_ / "c.mkv", "c");
    std::vector<transfer::TransferGroup> plan{
        {"One", "Anime", std::nullopt, {"a.mkv", "b.mkv"}},
        {"Two", "Anime", std::nullopt, {"c.mkv", "d.mkv", "e.mkv"}}
    };
    TransferEngine engine(EngineConfig{2, true});

    transfer::TransferReport report = engine.transfer(plan, source_, dest_, OperationKind::COPY);

    std::multiset<std::string> seen;
    for (const auto& group : report.groups) {
        for (const auto& [name, file] : group.files) {
            seen.insert(group.name + ":" + name);
        }
    }
    for (const auto& failure : report.failures) {
        seen.insert(failure.group + ":" + failure.filename);
    }
    EXPECT_EQ(seen, (std::multiset<std::string>{"One:a.mkv", "One:b.mkv", "Two:c.mkv", "Two:d.mkv", "Two:e.mkv"}));
}

TEST_F(TransferEngineTest, PartitionAddsDirectoryLevel) {
    write_file(source_ / "Beta_S02E01.mkv", "episode");
    transfer::TransferGroup beta{"Beta", "Anime", std::string("Beta Season 2"), {"Beta_S02E01.mkv"}};
    TransferEngine engine;

    engine.transfer({beta}, source_, dest_, OperationKind::COPY, true);

    fs::path season_dir = dest_ / "Anime" / "Beta" / "Beta Season 2";
    EXPECT_EQ(TransferEngine::group_directory(dest_, beta), season_dir);
    EXPECT_TRUE(fs::exists(season_dir / "Beta_S02E01.mkv"));
    auto sidecar = metadata::load(season_dir);
    ASSERT_TRUE(sidecar.has_value());
    EXPECT_TRUE(sidecar->is_series);
    ASSERT_TRUE(sidecar->partition.has_value());
    EXPECT_EQ(*sidecar->partition, "Beta Season 2");
}

TEST_F(TransferEngineTest, IntegrityOffOmitsDigests) {
    create_alpha_sources();
    TransferEngine engine(EngineConfig{4, false});

    engine.transfer({alpha()}, source_, dest_, OperationKind::MOVE);

    auto sidecar = metadata::load(dest_ / "Anime" / "Alpha");
    ASSERT_TRUE(sidecar.has_value());
    for (const auto& [name, file] : sidecar->files) {
        EXPECT_FALSE(file.md5.has_value());
        EXPECT_FALSE(file.sha256.has_value());
    }
    EXPECT_FALSE(fs::exists(source_ / "Alpha_E01.mkv"));
}

TEST_F(TransferEngineTest, CorruptedMoveKeepsSourceAndFails) {
    std::string data = testutils::payload(64000);
    write_file(source_ / "Delta.mkv", data);
    transfer::TransferGroup delta{"Delta", "American archive", std::nullopt, {"Delta.mkv"}};
    fs::path dest_file = dest_ / "American archive" / "Delta" / "Delta.mkv";

    TransferEngine engine(EngineConfig{1, true});
    engine.on_progress([&](const std::string&, std::uint64_t done, std::uint64_t total) {
        if (done == total) {
            std::ofstream out(dest_file, std::ios::binary | std::ios::app);
            out << "corrupt";
        }
    });

    transfer::TransferReport report = engine.transfer({delta}, source_, dest_, OperationKind::MOVE, true);

    EXPECT_TRUE(fs::exists(source_ / "Delta.mkv"));
    EXPECT_EQ(read_file(source_ / "Delta.mkv"), data);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].kind, transfer::ErrorKind::INTEGRITY);
    EXPECT_TRUE(report.groups.empty());
    EXPECT_FALSE(metadata::load(dest_ / "American archive" / "Delta").has_value());
    ASSERT_EQ(report.failed_groups().size(), 1u);
}

TEST_F(TransferEngineTest, ProgressAccumulatesToGroupTotal) {
    create_alpha_sources();
    TransferEngine engine(EngineConfig{2, false});

    std::mutex mu;
    std::uint64_t last_done = 0;
    std::uint64_t reported_total = 0;
    std::vector<transfer::GroupState> states;
    engine.on_progress([&](const std::string& group, std::uint64_t done, std::uint64_t total) {
        std::lock_guard<std::mutex> lock(mu);
        EXPECT_EQ(group, "Alpha");
        last_done = std::max(last_done, done);
        reported_total = total;
    });
    engine.on_state_change([&](const std::string&, transfer::GroupState state) {
        std::lock_guard<std::mutex> lock(mu);
        states.push_back(state);
    });

    engine.transfer({alpha()}, source_, dest_, OperationKind::COPY);

    EXPECT_EQ(reported_total, 450000u);
    EXPECT_EQ(last_done, 450000u);
    EXPECT_EQ(states, (std::vector<transfer::GroupState>{transfer::GroupState::IN_PROGRESS,
                                                         transfer::GroupState::COMPLETED}));
}

TEST_F(TransferEngineTest, CancelledEngineTransfersNothing) {
    create_alpha_sources();
    TransferEngine engine;
    engine.cancel();

    transfer::TransferReport report = engine.transfer({alpha()}, source_, dest_, OperationKind::MOVE, true);

    EXPECT_TRUE(report.groups.empty());
    ASSERT_EQ(report.failures.size(), 2u);
    for (const auto& failure : report.failures) {
        EXPECT_EQ(failure.kind, transfer::ErrorKind::CANCELLED);
    }
    EXPECT_TRUE(fs::exists(source_ / "Alpha_E01.mkv"));
    EXPECT_FALSE(fs::exists(dest_ / "Anime" / "Alpha"));
}

TEST_F(TransferEngineTest, CancelDuringGroupKeepsFinishedFiles) {
    write_file(source_ / "Eps_1.mkv", testutils::payload(1000, 1));
    write_file(source_ / "Eps_2.mkv", testutils::payload(1000, 2));
    write_file(source_ / "Eps_3.mkv", testutils::payload(1000, 3));
    transfer::TransferGroup eps{"Eps", "Anime", std::nullopt, {"Eps_1.mkv", "Eps_2.mkv", "Eps_3.mkv"}};
    transfer::TransferGroup later{"Later", "Anime", std::nullopt, {"Eps_3.mkv"}};

    // One worker runs tasks in submission order; the first file's progress triggers cancellation.
    TransferEngine engine(EngineConfig{1, true});
    engine.on_progress([&](const std::string&, std::uint64_t, std::uint64_t) { engine.cancel(); });

    transfer::TransferReport report = engine.transfer({eps, later}, source_, dest_, OperationKind::COPY, true);

    ASSERT_EQ(report.groups.size(), 1u);
    EXPECT_EQ(report.groups[0].files.size(), 1u);
    EXPECT_EQ(report.groups[0].files.count("Eps_1.mkv"), 1u);
    ASSERT_EQ(report.summaries.size(), 2u);
    EXPECT_EQ(report.summaries[0].state, transfer::GroupState::PARTIALLY_FAILED);
    EXPECT_EQ(report.summaries[1].state, transfer::GroupState::PENDING);
    EXPECT_EQ(report.failures.size(), 3u);

    auto sidecar = metadata::load(dest_ / "Anime" / "Eps");
    ASSERT_TRUE(sidecar.has_value());
    EXPECT_EQ(sidecar->files.size(), 1u);
}

TEST_F(TransferEngineTest, DestinationRootThatIsAFileAbortsRun) {
    create_alpha_sources();
    write_file(root_ / "not-a-dir", "x");
    TransferEngine engine;

    EXPECT_THROW(engine.transfer({alpha()}, source_, root_ / "not-a-dir", OperationKind::COPY, true),
                 transfer::IOError);
    EXPECT_TRUE(fs::exists(source_ / "Alpha_E01.mkv"));
}

TEST_F(TransferEngineTest, ZeroWorkersIsRejected) {
    EXPECT_THROW({ TransferEngine engine(EngineConfig{0, true}); }, std::invalid_argument);
}

TEST_F(TransferEngineTest, RerunOverwritesSidecar) {
    create_alpha_sources();
    TransferEngine engine;
    engine.transfer({alpha()}, source_, dest_, OperationKind::COPY, false);
    engine.transfer({alpha()}, source_, dest_, OperationKind::COPY, true);

    auto sidecar = metadata::load(dest_ / "Anime" / "Alpha");
    ASSERT_TRUE(sidecar.has_value());
    for (const auto& [name, file] : sidecar->files) {
        EXPECT_TRUE(file.md5.has_value());
    }
}

TEST_F(TransferEngineTest, UnrelatedDestinationFilesAreUntouched) {
    create_alpha_sources();
    write_file(dest_ / "Anime" / "Alpha" / "notes.txt", "keep me");
    TransferEngine engine;

    engine.transfer({alpha()}, source_, dest_, OperationKind::MOVE, true);

    EXPECT_EQ(read_file(dest_ / "Anime" / "Alpha" / "notes.txt"), "keep me");
}

TEST_F(TransferEngineTest, SubtitleFoldersFollowTheirGroup) {
    fs::path subs = root_ / "subtitles";
    write_file(subs / "Alpha.Subs" / "Alpha_E01.srt", "1\n00:00:01,000 --> 00:00:02,000\nHi\n");
    write_file(subs / "Alpha.Subs" / "Alpha_E02.srt", "1\n00:00:01,000 --> 00:00:02,000\nBye\n");
    write_file(subs / "Unrelated" / "x.srt", "x");
    TransferEngine engine;

    transfer::TransferReport report = engine.transfer_subtitles({alpha()}, subs, dest_, OperationKind::MOVE, true);

    fs::path sub_dir = dest_ / "Anime" / "Alpha" / "subtitles";
    EXPECT_TRUE(fs::exists(sub_dir / "Alpha_E01.srt"));
    EXPECT_TRUE(fs::exists(sub_dir / "Alpha_E02.srt"));
    EXPECT_FALSE(fs::exists(subs / "Alpha.Subs" / "Alpha_E01.srt"));
    EXPECT_TRUE(fs::exists(subs / "Unrelated" / "x.srt"));
    EXPECT_TRUE(report.failures.empty());
    EXPECT_FALSE(metadata::load(sub_dir).has_value());
}

TEST_F(TransferEngineTest, SubtitleFolderPrefersMatchingPartition) {
    fs::path subs = root_ / "subtitles";
    write_file(subs / "Beta Season 2 subs" / "Beta_S02E01.srt", "s2");
    transfer::TransferGroup season1{"Beta", "Anime", std::string("Season 1"), {}};
    transfer::TransferGroup season2{"Beta", "Anime", std::string("Season 2"), {}};
    TransferEngine engine;

    engine.transfer_subtitles({season1, season2}, subs, dest_, OperationKind::COPY, true);

    EXPECT_TRUE(fs::exists(dest_ / "Anime" / "Beta" / "Season 2" / "subtitles" / "Beta_S02E01.srt"));
    EXPECT_FALSE(fs::exists(dest_ / "Anime" / "Beta" / "Season 1" / "subtitles"));
}

TEST_F(TransferEngineTest, MissingSubtitleRootYieldsEmptyReport) {
    TransferEngine engine;
    transfer::TransferReport report =
        engine.transfer_subtitles({alpha()}, root_ / "no-subs", dest_, OperationKind::COPY, true);
    EXPECT_TRUE(report.groups.empty());
    EXPECT_TRUE(report.failures.empty());
}

TEST_F(TransferEngineTest, UnencodableFilenameReportsMetadataFailure) {
    // Latin-1 name, valid on disk but not UTF-8.
    const std::string latin1 = "Caf\xe9.mkv";
    write_file(source_ / latin1, "bonjour");
    transfer::TransferGroup cafe{"Cafe", "French archive", std::nullopt, {latin1}};
    TransferEngine engine;

    transfer::TransferReport report;
    ASSERT_NO_THROW(report = engine.transfer({cafe}, source_, dest_, OperationKind::MOVE, true));

    fs::path group_dir = dest_ / "French archive" / "Cafe";
    EXPECT_EQ(read_file(group_dir / latin1), "bonjour");
    EXPECT_FALSE(fs::exists(source_ / latin1));
    EXPECT_TRUE(report.failures.empty());
    ASSERT_EQ(report.groups.size(), 1u);
    EXPECT_EQ(report.groups[0].files.count(latin1), 1u);
    ASSERT_EQ(report.metadata_failures.size(), 1u);
    EXPECT_EQ(report.metadata_failures[0].group, "Cafe");
    EXPECT_FALSE(fs::exists(group_dir / metadata::SIDECAR_NAME));
    EXPECT_TRUE(report.degraded());
    EXPECT_TRUE(report.failed_groups().empty());
}

TEST_F(TransferEngineTest, BlockedSidecarDoesNotFailTheGroup) {
    create_alpha_sources();
    fs::path group_dir = dest_ / "Anime" / "Alpha";
    write_file(group_dir / metadata::SIDECAR_NAME / "occupied", "x");
    TransferEngine engine;

    transfer::TransferReport report = engine.transfer({alpha()}, source_, dest_, OperationKind::COPY, true);

    EXPECT_TRUE(fs::exists(group_dir / "Alpha_E01.mkv"));
    EXPECT_TRUE(fs::exists(group_dir / "Alpha_E02.mkv"));
    EXPECT_TRUE(report.failures.empty());
    ASSERT_EQ(report.groups.size(), 1u);
    EXPECT_EQ(report.groups[0].files.size(), 2u);
    ASSERT_EQ(report.metadata_failures.size(), 1u);
    EXPECT_EQ(report.metadata_failures[0].group, "Alpha");
    EXPECT_FALSE(report.metadata_failures[0].error.empty());
    EXPECT_EQ(report.summaries[0].state, transfer::GroupState::COMPLETED);
    EXPECT_TRUE(fs::is_directory(group_dir / metadata::SIDECAR_NAME));
    EXPECT_FALSE(fs::exists(group_dir / (std::string(metadata::SIDECAR_NAME) + ".tmp")));
}
