#include "batchrunner.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "../utils.hpp"
#include "../visualization.hpp"

namespace fs = std::filesystem;

namespace cellquant {

namespace {

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

/* Ошибка записи одного PNG не останавливает обработку изображения */
void writePng(const fs::path& path, const cv::Mat& img)
{
    try {
        if (!cv::imwrite(path.string(), img))
            std::cerr << "[BatchRunner] failed to write " << path.string() << std::endl;
    } catch (const cv::Exception& e) {
        std::cerr << "[BatchRunner] failed to write " << path.string() << ": " << e.what() << std::endl;
    }
}

std::string join(const std::vector<std::string>& parts, const std::string& sep)
{
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace

AnalysisKind parseAnalysisKind(const std::string& s)
{
    const std::string v = lower(s);
    if (v == "ld" || v == "lds")
        return AnalysisKind::LipidDroplets;
    if (v == "ros")
        return AnalysisKind::ReactiveOxygen;
    throw std::invalid_argument("unknown analysis '" + s + "' (expected ld or ros)");
}

std::string themeName(AnalysisKind kind)
{
    return kind == AnalysisKind::LipidDroplets ? "LDs" : "ROS";
}

BatchRunner::BatchRunner(AnalysisKind kind, AnalysisConfig config)
    : kind_(kind)
    , config_(std::move(config))
    , analyzer_(config_)
{
}

/* ---------- поиск изображений -------------------------------------- */
std::optional<ImageMetadata> BatchRunner::parseLayout(const fs::path& relative, const std::string& theme)
{
    std::vector<std::string> parts;
    for (const auto& p : relative) {
        const std::string s = p.string();
        if (!s.empty() && s != "/" && s != ".")
            parts.push_back(s);
    }
    if (parts.size() < 6 || lower(parts[1]) != lower(theme))
        return std::nullopt;

    ImageMetadata meta;
    meta.filename = relative.stem().string();
    meta.cellLine = parts[0];
    meta.irradiationSource = parts[2];
    meta.nanoparticles = parts[3];
    meta.dose = parts[4];
    meta.objective = join(std::vector<std::string>(parts.begin() + 5, parts.end() - 1), "_");
    return meta;
}

fs::path BatchRunner::outputFolder(const fs::path& root, const ImageMetadata& meta)
{
    fs::path out = root;
    for (const std::string* tag : {&meta.cellLine, &meta.irradiationSource, &meta.nanoparticles,
                                   &meta.dose, &meta.objective})
        if (!tag->empty())
            out /= *tag;
    return out;
}

std::vector<ImageJob> BatchRunner::discover(const std::string& input, const std::string& outputRoot) const
{
    const fs::path in(input);
    if (!fs::exists(in))
        throw std::runtime_error("[BatchRunner] input does not exist: " + input);

    std::vector<ImageJob> jobs;
    if (fs::is_regular_file(in)) {
        ImageJob job;
        job.path = in.string();
        job.meta.filename = in.stem().string();
        job.outputDir = fs::path(outputRoot).string();
        jobs.push_back(std::move(job));
        return jobs;
    }

    std::vector<std::string> exts;
    for (const auto& e : config_.batch.extensions)
        exts.push_back(lower(e));

    const std::string theme = themeName(kind_);
    int skipped = 0;
    for (const auto& entry : fs::recursive_directory_iterator(in)) {
        if (!entry.is_regular_file())
            continue;
        const std::string ext = lower(entry.path().extension().string());
        if (std::find(exts.begin(), exts.end(), ext) == exts.end())
            continue;

        const fs::path rel = fs::relative(entry.path(), in);
        auto meta = parseLayout(rel, theme);
        if (!meta) {
            ++skipped;
            continue;
        }
        ImageJob job;
        job.path = entry.path().string();
        job.meta = *meta;
        job.outputDir = outputFolder(outputRoot, *meta).string();
        jobs.push_back(std::move(job));
    }
    std::sort(jobs.begin(), jobs.end(),
              [](const ImageJob& a, const ImageJob& b) { return a.path < b.path; });

    std::cout << "[BatchRunner] found " << jobs.size() << " " << theme << " images";
    if (skipped)
        std::cout << " (" << skipped << " outside the expected layout skipped)";
    std::cout << std::endl;
    return jobs;
}

fs::path BatchRunner::completionMarker(const ImageJob& job)
{
    return fs::path(job.outputDir) / (job.meta.filename + "_nuclei_overlay.png");
}

/* ---------- экспорт растров ---------------------------------------- */
void BatchRunner::exportNuclei(const NucleusSegmentation& nuc, const cv::Mat& image, const ImageJob& job) const
{
    const fs::path dir(job.outputDir);
    const std::string& name = job.meta.filename;
    writePng(dir / (name + "_nuclei.png"), nuc.mask);
    // overlay последним: по нему определяется, что изображение обработано
    writePng(completionMarker(job), labelOverlay(nuc.labels, image, config_.batch.nucleusOverlayAlpha));
}

void BatchRunner::exportLipid(const LipidAnalysis& a, const cv::Mat& image, const ImageJob& job) const
{
    const fs::path dir(job.outputDir);
    const std::string& name = job.meta.filename;
    const double alpha = config_.batch.overlayAlpha;

    writePng(dir / (name + "_LDGreen_overlay.png"), labelOverlay(a.green.labels, image, alpha));
    writePng(dir / (name + "_LDRed_overlay.png"), labelOverlay(a.red.labels, image, alpha));
    writePng(dir / (name + "_LDColoc_overlay.png"), labelOverlay(a.colocalized.labels, image, alpha));
    writePng(dir / (name + "_LD_diffuse_overlay.png"),
             labelOverlay(a.diffuse.labels, image, config_.batch.diffuseOverlayAlpha));

    writePng(dir / (name + "_LDGreen_mask.png"), a.green.reconstruction.color);
    writePng(dir / (name + "_LDRed_mask.png"), a.red.reconstruction.color);
    writePng(dir / (name + "_LDColoc_mask.png"), a.colocalized.reconstruction.color);
    writePng(dir / (name + "_LD_diffuse_mask.png"), a.diffuse.detectionMask);
    writePng(dir / (name + "_LD_legend.png"), createSizeLegendImage());
}

void BatchRunner::exportReactiveOxygen(const RosAnalysis& a, const cv::Mat& image, const ImageJob& job) const
{
    const fs::path dir(job.outputDir);
    const std::string& name = job.meta.filename;

    writePng(dir / (name + "_ROS_overlay.png"), labelOverlay(a.punctate.labels, image, config_.batch.overlayAlpha));
    writePng(dir / (name + "_ROS_diffuse_overlay.png"),
             labelOverlay(a.diffuse.labels, image, config_.batch.diffuseOverlayAlpha));
    writePng(dir / (name + "_ROS_mask.png"), a.punctate.detectionMask);
    writePng(dir / (name + "_ROS_diffuse_mask.png"), a.diffuse.detectionMask);
}

/* ---------- одно изображение --------------------------------------- */
BatchItemResult BatchRunner::processOne(const ImageJob& job) const
{
    BatchItemResult row;
    row.image = job.path;

    if (config_.batch.skipExisting) {
        std::error_code ec;
        const bool done = fs::exists(completionMarker(job), ec);
        if (ec) {
            std::cerr << "[BatchRunner] warning: cannot check " << completionMarker(job).string()
                      << ": " << ec.message() << std::endl;
        } else if (done) {
            row.status = "skipped";
            row.message = "already processed";
            return row;
        }
    }

    try {
        fs::create_directories(job.outputDir);
        const cv::Mat image = loadImageFromFile(job.path);
        const ReportWriter writer(job.meta);

        if (kind_ == AnalysisKind::LipidDroplets) {
            const LipidAnalysis a = analyzer_.analyzeLipidDroplets(image);
            row.nuclei = a.nuclei.count();
            for (const SpeciesResult* s : {&a.green, &a.red, &a.colocalized, &a.diffuse})
                row.counts.emplace_back(s->name, s->count());
            if (config_.batch.writeReports)
                writer.writeLipid(a, job.outputDir);
            if (config_.batch.writeImages) {
                exportLipid(a, image, job);
                exportNuclei(a.nuclei, image, job);
            }
        } else {
            const RosAnalysis a = analyzer_.analyzeReactiveOxygen(image);
            row.nuclei = a.nuclei.count();
            for (const SpeciesResult* s : {&a.punctate, &a.diffuse})
                row.counts.emplace_back(s->name, s->count());
            if (config_.batch.writeReports)
                writer.writeReactiveOxygen(a, job.outputDir);
            if (config_.batch.writeImages) {
                exportReactiveOxygen(a, image, job);
                exportNuclei(a.nuclei, image, job);
            }
        }
        row.status = "ok";
    } catch (const InputShapeError& e) {
        row.status = "failed";
        row.message = std::string("bad input: ") + e.what();
    } catch (const cv::Exception& e) {
        row.status = "failed";
        row.message = std::string("OpenCV: ") + e.what();
    } catch (const std::exception& e) {
        row.status = "failed";
        row.message = e.what();
    }
    return row;
}

/* ---------- пул воркеров ------------------------------------------- */
std::vector<BatchItemResult> BatchRunner::run(const std::vector<ImageJob>& jobs)
{
    std::vector<BatchItemResult> rows(jobs.size());
    for (size_t i = 0; i < jobs.size(); ++i) {
        rows[i].image = jobs[i].path;
        rows[i].status = "cancelled";
    }

    std::atomic<size_t> next{0};
    std::atomic<size_t> done{0};
    auto work = [&]() {
        while (true) {
            if (stop_.load())
                break;
            const size_t i = next.fetch_add(1);
            if (i >= jobs.size())
                break;

            BatchItemResult row = processOne(jobs[i]);
            const size_t n = done.fetch_add(1) + 1;

            std::lock_guard<std::mutex> lock(mutex_);
            if (row.status == "failed")
                std::cerr << "[BatchRunner] " << jobs[i].meta.filename << " failed: " << row.message << std::endl;
            std::cout << "[BatchRunner] " << n << "/" << jobs.size() << " "
                      << jobs[i].meta.filename << ": " << row.status << std::endl;
            rows[i] = std::move(row);
        }
    };

    const int workers = std::max(1, std::min<int>(config_.batch.workers, static_cast<int>(jobs.size())));
    if (workers > 1) {
        std::vector<std::thread> pool;
        for (int w = 0; w < workers; ++w)
            pool.emplace_back(work);
        for (auto& t : pool)
            t.join();
    } else {
        work();
    }

    if (stop_.load())
        std::cout << "[BatchRunner] stopped by user after " << done.load() << " images" << std::endl;
    return rows;
}

/* ---------- сводка -------------------------------------------------- */
std::string BatchRunner::summaryCsv(const std::vector<BatchItemResult>& rows)
{
    // Столбцы видов берём в порядке первого появления
    std::vector<std::string> species;
    for (const auto& r : rows)
        for (const auto& c : r.counts)
            if (std::find(species.begin(), species.end(), c.first) == species.end())
                species.push_back(c.first);

    std::ostringstream oss;
    oss << "Image,Status,Nuclei";
    for (const auto& s : species)
        oss << ',' << ReportWriter::csvField(s);
    oss << ",Message\n";

    for (const auto& r : rows) {
        oss << ReportWriter::csvField(r.image) << ',' << r.status << ',' << r.nuclei;
        for (const auto& s : species) {
            auto it = std::find_if(r.counts.begin(), r.counts.end(),
                                   [&](const std::pair<std::string, int>& c) { return c.first == s; });
            oss << ',';
            if (it != r.counts.end())
                oss << it->second;
        }
        oss << ',' << ReportWriter::csvField(r.message) << '\n';
    }
    return oss.str();
}

void BatchRunner::writeSummary(const std::vector<BatchItemResult>& rows, const std::string& path)
{
    std::ofstream out(path);
    if (!out)
        throw std::runtime_error("[BatchRunner] cannot open " + path);
    out << summaryCsv(rows);
    std::cout << "[BatchRunner] summary written to " << path << std::endl;
}

} // namespace cellquant
