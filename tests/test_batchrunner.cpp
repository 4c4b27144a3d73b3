#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include "batch/batchrunner.hpp"
#include "test_helpers.hpp"

using namespace cellquant;
namespace fs = std::filesystem;

namespace {

/* временный каталог, удаляется в деструкторе */
class TempDir {
public:
    explicit TempDir(const std::string& name)
        : path_(fs::temp_directory_path() / name)
    {
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

void touch(const fs::path& p)
{
    fs::create_directories(p.parent_path());
    std::ofstream out(p);
}

AnalysisConfig quietConfig()
{
    AnalysisConfig cfg;
    cfg.debug.show = false;
    cfg.nucleus.minArea = 50;
    return cfg;
}

/// BGR 8-bit picture with one nucleus and two green droplets beside it.
void writeSyntheticCell(const fs::path& p)
{
    cv::Mat1f blue = cv::Mat1f::zeros(96, 96);
    cv::Mat1f green = cv::Mat1f::zeros(96, 96);
    cv::Mat1f red = cv::Mat1f::zeros(96, 96);
    test::drawDisk<float>(blue, {48, 48}, 10, 0.9f);
    test::drawDisk<float>(green, {70, 48}, 3, 0.8f);
    test::drawDisk<float>(green, {26, 48}, 3, 0.8f);

    cv::Mat rgb = test::rgbImage(red, green, blue), bgr8;
    cv::cvtColor(rgb, rgb, cv::COLOR_RGB2BGR);
    rgb.convertTo(bgr8, CV_8UC3, 255.0);
    fs::create_directories(p.parent_path());
    ASSERT_TRUE(cv::imwrite(p.string(), bgr8));
}

} // namespace

TEST(BatchRunnerTest, ParseAnalysisKind)
{
    EXPECT_EQ(parseAnalysisKind("ld"), AnalysisKind::LipidDroplets);
    EXPECT_EQ(parseAnalysisKind("LDs"), AnalysisKind::LipidDroplets);
    EXPECT_EQ(parseAnalysisKind("ROS"), AnalysisKind::ReactiveOxygen);
    EXPECT_THROW(parseAnalysisKind("dapi"), std::invalid_argument);
    EXPECT_EQ(themeName(AnalysisKind::ReactiveOxygen), "ROS");
}

TEST(BatchRunnerTest, ParseLayoutReadsTags)
{
    auto meta = BatchRunner::parseLayout("HeLa/lds/Xray/AuNP/2Gy/63x/oil/img01.tif", "LDs");
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta->filename, "img01");
    EXPECT_EQ(meta->cellLine, "HeLa");
    EXPECT_EQ(meta->irradiationSource, "Xray");
    EXPECT_EQ(meta->nanoparticles, "AuNP");
    EXPECT_EQ(meta->dose, "2Gy");
    EXPECT_EQ(meta->objective, "63x_oil");

    auto flat = BatchRunner::parseLayout("HeLa/ROS/Xray/AuNP/2Gy/img.tif", "ROS");
    ASSERT_TRUE(flat.has_value());
    EXPECT_EQ(flat->objective, "");
}

TEST(BatchRunnerTest, ParseLayoutRejectsOtherTrees)
{
    EXPECT_FALSE(BatchRunner::parseLayout("HeLa/LDs/Xray/img.tif", "LDs").has_value());
    EXPECT_FALSE(BatchRunner::parseLayout("HeLa/ROS/Xray/AuNP/2Gy/63x/img.tif", "LDs").has_value());
}

TEST(BatchRunnerTest, OutputFolderSkipsEmptyTags)
{
    ImageMetadata meta;
    meta.cellLine = "HeLa";
    meta.irradiationSource = "Xray";
    meta.nanoparticles = "AuNP";
    meta.dose = "2Gy";
    meta.objective = "";
    EXPECT_EQ(BatchRunner::outputFolder("/out", meta).string(), fs::path("/out/HeLa/Xray/AuNP/2Gy").string());
}

TEST(BatchRunnerTest, DiscoverFiltersLayoutAndExtension)
{
    TempDir root("cellquant_discover_test");
    const fs::path in = root.path() / "in";
    touch(in / "HeLa/LDs/Xray/AuNP/2Gy/63x/b.TIF");
    touch(in / "HeLa/LDs/Xray/AuNP/2Gy/63x/a.tif");
    touch(in / "HeLa/LDs/Xray/AuNP/2Gy/63x/notes.txt");
    touch(in / "HeLa/ROS/Xray/AuNP/2Gy/63x/c.tif");
    touch(in / "stray.tif");

    BatchRunner runner(AnalysisKind::LipidDroplets, quietConfig());
    std::vector<ImageJob> jobs = runner.discover(in.string(), (root.path() / "out").string());
    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_EQ(jobs[0].meta.filename, "a");
    EXPECT_EQ(jobs[1].meta.filename, "b");
    EXPECT_EQ(jobs[0].outputDir, (root.path() / "out/HeLa/Xray/AuNP/2Gy/63x").string());

    // одиночный файл
    std::vector<ImageJob> single = runner.discover((in / "stray.tif").string(), (root.path() / "out").string());
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(single[0].meta.cellLine, "unknown");
    EXPECT_EQ(single[0].outputDir, (root.path() / "out").string());

    EXPECT_THROW(runner.discover((root.path() / "missing").string(), "out"), std::runtime_error);
}

TEST(BatchRunnerTest, StopBeforeRunCancelsEverything)
{
    std::vector<ImageJob> jobs(3);
    for (size_t i = 0; i < jobs.size(); ++i) {
        jobs[i].path = "img" + std::to_string(i) + ".tif";
        jobs[i].meta.filename = "img" + std::to_string(i);
    }
    BatchRunner runner(AnalysisKind::LipidDroplets, quietConfig());
    runner.requestStop();
    std::vector<BatchItemResult> rows = runner.run(jobs);
    ASSERT_EQ(rows.size(), 3u);
    for (const auto& r : rows)
        EXPECT_EQ(r.status, "cancelled");
}

TEST(BatchRunnerTest, UnreadableImagesFailWithoutStoppingBatch)
{
    TempDir root("cellquant_failed_test");
    touch(root.path() / "empty.tif");

    AnalysisConfig cfg = quietConfig();
    cfg.batch.workers = 2;
    BatchRunner runner(AnalysisKind::ReactiveOxygen, cfg);

    std::vector<ImageJob> jobs(2);
    jobs[0].path = (root.path() / "empty.tif").string();
    jobs[0].meta.filename = "empty";
    jobs[0].outputDir = (root.path() / "out").string();
    jobs[1].path = (root.path() / "missing.tif").string();
    jobs[1].meta.filename = "missing";
    jobs[1].outputDir = (root.path() / "out").string();

    std::vector<BatchItemResult> rows = runner.run(jobs);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].status, "failed");
    EXPECT_EQ(rows[1].status, "failed");
    EXPECT_FALSE(rows[1].message.empty());
}

TEST(BatchRunnerTest, GrayImageIsBadInput)
{
    TempDir root("cellquant_gray_test");
    const fs::path p = root.path() / "gray.png";
    ASSERT_TRUE(cv::imwrite(p.string(), cv::Mat1b(16, 16, uchar(100))));

    ImageJob job;
    job.path = p.string();
    job.meta.filename = "gray";
    job.outputDir = (root.path() / "out").string();
    BatchItemResult row = BatchRunner(AnalysisKind::LipidDroplets, quietConfig()).processOne(job);
    EXPECT_EQ(row.status, "failed");
    EXPECT_EQ(row.message.rfind("bad input: ", 0), 0u);
}

TEST(BatchRunnerTest, ExistingOverlayIsSkipped)
{
    TempDir root("cellquant_skip_test");
    ImageJob job;
    job.path = (root.path() / "img.tif").string();
    job.meta.filename = "img";
    job.outputDir = root.path().string();
    touch(BatchRunner::completionMarker(job));

    BatchItemResult row = BatchRunner(AnalysisKind::LipidDroplets, quietConfig()).processOne(job);
    EXPECT_EQ(row.status, "skipped");

    AnalysisConfig cfg = quietConfig();
    cfg.batch.skipExisting = false;
    BatchItemResult again = BatchRunner(AnalysisKind::LipidDroplets, cfg).processOne(job);
    EXPECT_EQ(again.status, "failed");
}

TEST(BatchRunnerTest, UncheckableMarkerFailsOnlyThatImage)
{
    TempDir root("cellquant_marker_test");
    ImageJob job;
    job.path = (root.path() / "img.tif").string();
    job.meta.filename = "img";
    // компонент длиннее NAME_MAX: stat() завершается с ENAMETOOLONG
    job.outputDir = (root.path() / std::string(300, 'x')).string();

    BatchItemResult row;
    ASSERT_NO_THROW(row = BatchRunner(AnalysisKind::LipidDroplets, quietConfig()).processOne(job));
    EXPECT_EQ(row.status, "failed");
    EXPECT_FALSE(row.message.empty());
}

TEST(BatchRunnerTest, LipidImageProducesReportsAndMarker)
{
    TempDir root("cellquant_lipid_run_test");
    const fs::path in = root.path() / "in/HeLa/LDs/Xray/AuNP/2Gy/63x/cell.png";
    writeSyntheticCell(in);

    AnalysisConfig cfg = quietConfig();
    cfg.batch.extensions = {".png"};
    BatchRunner runner(AnalysisKind::LipidDroplets, cfg);
    std::vector<ImageJob> jobs = runner.discover((root.path() / "in").string(), (root.path() / "out").string());
    ASSERT_EQ(jobs.size(), 1u);

    std::vector<BatchItemResult> rows = runner.run(jobs);
    ASSERT_EQ(rows.size(), 1u);
    ASSERT_EQ(rows[0].status, "ok") << rows[0].message;
    EXPECT_EQ(rows[0].nuclei, 1);
    ASSERT_EQ(rows[0].counts.size(), 4u);
    EXPECT_EQ(rows[0].counts[0].first, "Green");

    const fs::path out(jobs[0].outputDir);
    EXPECT_TRUE(fs::exists(out / "cell_LDReport_global.csv"));
    EXPECT_TRUE(fs::exists(out / "cell_LDReport_nuclei.csv"));
    EXPECT_TRUE(fs::exists(out / "cell_LDReport_objects.csv"));
    EXPECT_TRUE(fs::exists(out / "cell_LDGreen_overlay.png"));
    EXPECT_TRUE(fs::exists(BatchRunner::completionMarker(jobs[0])));

    // повторный запуск пропускает готовое изображение
    EXPECT_EQ(runner.run(jobs)[0].status, "skipped");
}

TEST(BatchRunnerTest, SummaryCsvColumns)
{
    BatchItemResult ok;
    ok.image = "a.tif";
    ok.status = "ok";
    ok.nuclei = 3;
    ok.counts = {{"ROS", 5}, {"ROS Diffuse", 1}};
    BatchItemResult failed;
    failed.image = "b.tif";
    failed.status = "failed";
    failed.message = "bad input: x, y";

    const std::string csv = BatchRunner::summaryCsv({ok, failed});
    EXPECT_EQ(csv,
              "Image,Status,Nuclei,ROS,ROS Diffuse,Message\n"
              "a.tif,ok,3,5,1,\n"
              "b.tif,failed,0,,,\"bad input: x, y\"\n");
}
