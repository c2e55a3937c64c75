#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "app.hpp"
#include "datasetWriter.hpp"
#include "errors.hpp"
#include "pipeline.hpp"
#include "testUtil.hpp"

using namespace ACC;

namespace {
    class RecordingSink : public DiagnosticsSink {
    public:
        void emit(const Figure& fig) override { figures.push_back(fig); }
        std::vector<Figure> figures;
    };
}

TEST(Pipeline, TwoSingleRecordTrials){
    TempDir dir;
    dir.write("trial1.txt", "0\t32\t63\n");
    dir.write("trial2.txt", "63\t0\t32\n");

    const Dataset d = process(dir.str(), 1);

    EXPECT_EQ(d.numSamples, 1u);
    ASSERT_EQ(d.x.rows(), 1u);
    ASSERT_EQ(d.x.cols(), 2u);
    ASSERT_EQ(d.y.cols(), 2u);
    ASSERT_EQ(d.z.cols(), 2u);

    EXPECT_NEAR(d.x(0, 0), -14.709, 1e-9);
    EXPECT_NEAR(d.x(0, 1), 14.709, 1e-9);
    EXPECT_NEAR(d.y(0, 0), 0.0, 0.25);
    EXPECT_NEAR(d.y(0, 1), -14.709, 1e-9);
    EXPECT_NEAR(d.z(0, 0), 14.709, 1e-9);
    EXPECT_NEAR(d.z(0, 1), 0.0, 0.25);
}

TEST(Pipeline, ShapePreservedByFilter){
    TempDir dir;
    for (int k = 0; k < 4; ++k) {
        dir.write("t" + std::to_string(k) + ".txt", records(25, k, 2 * k, 3 * k));
    }
    const Dataset d = process(dir.str(), 5);
    EXPECT_EQ(d.numSamples, 25u);
    for (const AxisMatrix* m : {&d.x, &d.y, &d.z}) {
        EXPECT_EQ(m->rows(), 25u);
        EXPECT_EQ(m->cols(), 4u);
    }
}

TEST(Pipeline, DefaultWindowRemovesSpike){
    TempDir dir;
    std::string content = records(5, 40, 40, 40) + "63\t0\t40\n" + records(5, 40, 40, 40);
    dir.write("spiky.txt", content);

    const Dataset d = process(dir.str());
    const double level = to_physical(40);
    for (std::size_t r = 1; r + 1 < d.numSamples; ++r) {
        EXPECT_DOUBLE_EQ(d.x(r, 0), level) << "row " << r;
        EXPECT_DOUBLE_EQ(d.y(r, 0), level) << "row " << r;
    }
}

TEST(Pipeline, UnequalTrialsFailWithoutResult){
    TempDir dir;
    dir.write("a.txt", records(100, 10, 20, 30));
    dir.write("b.txt", records(99, 10, 20, 30));

    try {
        process(dir.str());
        FAIL() << "expected AlignmentError";
    } catch (const AlignmentError& e) {
        EXPECT_EQ(e.expected(), 100u);
        EXPECT_EQ(e.actual(), 99u);
    }
}

TEST(Pipeline, WindowErrors){
    TempDir dir;
    dir.write("a.txt", records(4, 1, 2, 3));

    EXPECT_THROW(process(dir.str(), 2), ConfigError);
    EXPECT_THROW(process(dir.str(), 0), ConfigError);
    EXPECT_THROW(process(dir.str(), 5), ConfigError);

    // parity is checked before the directory is looked at
    EXPECT_THROW(process((dir.path() / "missing").string(), 4), ConfigError);
    EXPECT_THROW(process((dir.path() / "missing").string(), 3), IOError);
}

TEST(Pipeline, DiagnosticsFigures){
    TempDir dir;
    dir.write("a.txt", records(6, 1, 2, 3));
    dir.write("b.txt", records(6, 4, 5, 6));

    RecordingSink sink;
    ProcessOptions opt;
    opt.spectrumOrders = {1, 3, 5, 7};
    const Dataset d = process(dir.str(), opt, &sink);

    // two trials, noisy dataset, filtered dataset, spectra
    ASSERT_EQ(sink.figures.size(), 5u);
    EXPECT_EQ(sink.figures[2].title, "Noisy modeling dataset");
    EXPECT_EQ(sink.figures[3].title, "Filtered modeling dataset");
    EXPECT_EQ(sink.figures[3].panels[0].series[1].y, d.x.column(1));

    const Panel& spectra = sink.figures[4].panels.at(0);
    // order 7 exceeds the 6 samples
    ASSERT_EQ(spectra.series.size(), 3u);
    EXPECT_EQ(spectra.series[0].label, "NO filtering");
    EXPECT_EQ(spectra.series[1].label, "filter n = 3");
    EXPECT_EQ(spectra.series[0].x.size(), 4u);
    EXPECT_DOUBLE_EQ(spectra.series[0].x.back(), 16.0);
}

TEST(Pipeline, DiagnosticsDoNotChangeResult){
    TempDir dir;
    dir.write("a.txt", "1\t2\t3\n9\t9\t9\n1\t2\t3\n4\t5\t6\n");
    RecordingSink sink;
    const Dataset with = process(dir.str(), 3, &sink);
    const Dataset without = process(dir.str(), 3);
    EXPECT_EQ(with.x, without.x);
    EXPECT_EQ(with.y, without.y);
    EXPECT_EQ(with.z, without.z);
}

TEST(DatasetWriter, WritesColumnsPerTrial){
    TempDir dir;
    dir.write("a.txt", records(3, 0, 0, 0));
    dir.write("b.txt", records(3, 63, 63, 63));
    const Dataset d = process(dir.str(), 1);

    const std::string path = (dir.path() / "out.json").string();
    write_dataset(d, path);

    std::ifstream in(path);
    const nlohmann::json j = nlohmann::json::parse(in);
    EXPECT_EQ(j["numSamples"].get<std::size_t>(), 3u);
    EXPECT_EQ(j["trials"].get<std::vector<std::string>>(), (std::vector<std::string>{"a.txt", "b.txt"}));
    ASSERT_EQ(j["x"].size(), 2u);
    EXPECT_EQ(j["x"][1].get<std::vector<double>>(), d.x.column(1));
}

TEST(DatasetWriter, UnwritablePathIsIOError){
    TempDir dir;
    EXPECT_THROW(write_dataset(Dataset(), (dir.path() / "no" / "out.json").string()), IOError);
}

TEST(App, ExitStatusPerErrorKind){
    TempDir dir;
    Config cfg;
    cfg.quiet = true;

    cfg.dataDir = (dir.path() / "missing").string();
    EXPECT_EQ(run(cfg), EXIT_IO);

    dir.write("a.txt", records(3, 1, 1, 1));
    cfg.dataDir = dir.str();
    cfg.windowSize = 4;
    EXPECT_EQ(run(cfg), EXIT_CONFIG);

    cfg.windowSize = 3;
    cfg.output = (dir.path() / "out.json").string();
    EXPECT_EQ(run(cfg), EXIT_OK);
    EXPECT_TRUE(std::filesystem::exists(cfg.output));

    dir.write("b.txt", records(2, 1, 1, 1));
    EXPECT_EQ(run(cfg), EXIT_ALIGNMENT);

    dir.write("b.txt", "1\t1\n");
    EXPECT_EQ(run(cfg), EXIT_FORMAT);
}

TEST(DatasetWriter, NonUtf8TrialNameIsReplaced){
    TempDir dir;
    dir.write("t\xff.txt", records(3, 1, 2, 3));
    const Dataset d = process(dir.str(), 3);
    ASSERT_EQ(d.trials.size(), 1u);

    const std::string path = (dir.path() / "out.json").string();
    EXPECT_NO_THROW(write_dataset(d, path));

    std::ifstream in(path);
    const nlohmann::json j = nlohmann::json::parse(in);
    EXPECT_EQ(j["trials"][0].get<std::string>(), "t\xef\xbf\xbd.txt");
    EXPECT_EQ(j["x"][0].get<std::vector<double>>(), d.x.column(0));
}

TEST(App, NonUtf8TrialNameStillWritesOutputs){
    TempDir dir;
    dir.write("t\xff.txt", records(3, 1, 2, 3));

    Config cfg;
    cfg.quiet = true;
    cfg.dataDir = dir.str();
    cfg.output = (dir.path() / "out.json").string();
    cfg.diagnosticsJson = (dir.path() / "diag.jsonl").string();

    EXPECT_EQ(run(cfg), EXIT_OK);

    std::ifstream out(cfg.output);
    nlohmann::json j;
    EXPECT_NO_THROW(j = nlohmann::json::parse(out));
    EXPECT_EQ(j["numSamples"].get<std::size_t>(), 3u);

    std::ifstream diag(cfg.diagnosticsJson);
    std::string line;
    std::size_t lines = 0;
    while (std::getline(diag, line)) {
        nlohmann::json fig;
        EXPECT_NO_THROW(fig = nlohmann::json::parse(line));
        ++lines;
    }
    // trial, noisy dataset, filtered dataset, spectra
    EXPECT_EQ(lines, 4u);
}

TEST(Pipeline, InvalidSpectrumOrdersAreSkipped){
    TempDir dir;
    dir.write("a.txt", records(8, 1, 2, 3));

    RecordingSink sink;
    ProcessOptions opt;
    opt.spectrumOrders = {1, 4, -3, 0, 3};
    Dataset d;
    EXPECT_NO_THROW(d = process(dir.str(), opt, &sink));
    EXPECT_EQ(d.numSamples, 8u);

    ASSERT_EQ(sink.figures.size(), 4u);
    const Panel& spectra = sink.figures[3].panels.at(0);
    ASSERT_EQ(spectra.series.size(), 2u);
    EXPECT_EQ(spectra.series[0].label, "NO filtering");
    EXPECT_EQ(spectra.series[1].label, "filter n = 3");
}
