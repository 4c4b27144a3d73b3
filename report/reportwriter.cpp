#include "reportwriter.h"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace cellquant {

namespace {

const double kNaN = std::numeric_limits<double>::quiet_NaN();

double meanNucleusArea(const NucleusSegmentation& nuc)
{
    if (nuc.nuclei.empty())
        return kNaN;
    double sum = 0.0;
    for (const auto& n : nuc.nuclei)
        sum += n.area;
    return sum / nuc.nuclei.size();
}

/* строка "ключ,значение" */
void row(std::ostringstream& oss, const std::string& key, const std::string& value)
{
    oss << ReportWriter::csvField(key) << ',' << value << '\n';
}

void row(std::ostringstream& oss, const std::string& key, double value)
{
    row(oss, key, ReportWriter::formatValue(value));
}

} // namespace

/* ---------- форматирование ----------------------------------------- */
std::string ReportWriter::formatValue(double v)
{
    if (std::isnan(v))
        return "NaN";
    if (std::isinf(v))
        return v > 0 ? "Inf" : "-Inf";
    std::ostringstream oss;
    oss << std::setprecision(10) << v;
    return oss.str();
}

std::string ReportWriter::formatValue(const std::optional<double>& v)
{
    return v ? formatValue(*v) : "NaN";
}

std::string ReportWriter::csvField(const std::string& s)
{
    if (s.find_first_of(",\"\n") == std::string::npos)
        return s;
    std::string quoted = "\"";
    for (char c : s) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

/* ---------- статистика --------------------------------------------- */
SpeciesSummary ReportWriter::summarize(const std::vector<RegionRecord>& regions, IntensitySource src)
{
    SpeciesSummary s;
    s.count = static_cast<int>(regions.size());
    if (regions.empty())
        return s;

    double ecc = 0.0, diam = 0.0;
    std::vector<double> intensity;
    double fluor = 0.0;
    for (const auto& r : regions) {
        s.totalArea += r.area;
        ecc += r.eccentricity;
        diam += r.equivDiameter;

        std::optional<double> v;
        if (src == IntensitySource::Red)
            v = r.meanIntensityRed ? r.meanIntensityRed : r.meanIntensityColoc;
        else
            v = r.meanIntensityGreen;
        if (v) {
            intensity.push_back(*v);
            fluor += r.area * *v;
        }
    }
    const double n = static_cast<double>(regions.size());
    s.meanArea = s.totalArea / n;
    s.meanEccentricity = ecc / n;
    s.meanEquivDiameter = diam / n;

    if (!intensity.empty()) {
        double mean = 0.0;
        for (double v : intensity) mean += v;
        mean /= intensity.size();
        s.meanIntensity = mean;
        s.totalFluorescence = fluor;
        if (intensity.size() > 1) {
            double ss = 0.0;
            for (double v : intensity) ss += (v - mean) * (v - mean);
            s.stdIntensity = std::sqrt(ss / (intensity.size() - 1));
        } else {
            s.stdIntensity = 0.0;
        }
    }
    return s;
}

double ReportWriter::meanPerNucleus(const SpeciesResult& species)
{
    if (species.numNuclei <= 0)
        return kNaN;
    const NucleusGroups groups = species.groups();
    size_t total = 0;
    for (const auto& g : groups)
        total += g.size();
    return static_cast<double>(total) / species.numNuclei;
}

double ReportWriter::meanRedGreenRatio(const std::vector<RegionRecord>& regions)
{
    double sum = 0.0;
    int n = 0;
    for (const auto& r : regions) {
        if (!r.meanIntensityRed || !r.meanIntensityGreen || *r.meanIntensityGreen <= 0.0)
            continue;
        sum += *r.meanIntensityRed / *r.meanIntensityGreen;
        ++n;
    }
    return n > 0 ? sum / n : kNaN;
}

/* ---------- таблица объектов --------------------------------------- */
std::string ReportWriter::objectHeader()
{
    return "Channel,ID,AssignedNucleus,CentroidX,CentroidY,Area,Perimeter,Circularity,"
           "Eccentricity,Solidity,Extent,EquivDiameter,MajorAxisLength,MinorAxisLength,"
           "Orientation,ConvexArea,MeanIntensityRed,MeanIntensityGreen,MeanIntensityColoc,"
           "MeanRatio,CellLine,Dose,Nanoparticles\n";
}

void ReportWriter::objectRows(std::ostringstream& oss, const SpeciesResult& species) const
{
    for (const auto& r : species.regions) {
        const double circ = r.perimeter > 0.0
                                ? 4.0 * CV_PI * r.area / (r.perimeter * r.perimeter)
                                : kNaN;
        double ratio = kNaN;
        if (r.meanIntensityRed && r.meanIntensityGreen && *r.meanIntensityGreen > 0.0)
            ratio = *r.meanIntensityRed / *r.meanIntensityGreen;

        oss << csvField(species.name) << ','
            << r.id << ','
            << (r.assignedNucleusId ? std::to_string(*r.assignedNucleusId) : std::string("NaN")) << ','
            << formatValue(r.centroid.x) << ',' << formatValue(r.centroid.y) << ','
            << r.area << ','
            << formatValue(r.perimeter) << ','
            << formatValue(circ) << ','
            << formatValue(r.eccentricity) << ','
            << formatValue(r.solidity) << ','
            << formatValue(r.extent) << ','
            << formatValue(r.equivDiameter) << ','
            << formatValue(r.majorAxisLength) << ','
            << formatValue(r.minorAxisLength) << ','
            << formatValue(r.orientation) << ','
            << r.convexArea << ','
            << formatValue(r.meanIntensityRed) << ','
            << formatValue(r.meanIntensityGreen) << ','
            << formatValue(r.meanIntensityColoc) << ','
            << formatValue(ratio) << ','
            << csvField(meta_.cellLine) << ','
            << csvField(meta_.dose) << ','
            << csvField(meta_.nanoparticles) << '\n';
    }
}

/* ---------- LD ----------------------------------------------------- */
std::string ReportWriter::lipidGlobal(const LipidAnalysis& a) const
{
    using S = IntensitySource;
    const SpeciesSummary R = summarize(a.red.regions, S::Red);
    const SpeciesSummary G = summarize(a.green.regions, S::Red);
    const SpeciesSummary C = summarize(a.colocalized.regions, S::Red);
    const SpeciesSummary D = summarize(a.diffuse.regions, S::Red);

    std::ostringstream oss;
    oss << "Metric,Value\n";
    row(oss, "Filename", csvField(meta_.filename));
    row(oss, "Cell Line", csvField(meta_.cellLine));
    row(oss, "Dose", csvField(meta_.dose));
    row(oss, "NPs", csvField(meta_.nanoparticles));
    row(oss, "Num Nuclei", std::to_string(a.nuclei.count()));
    row(oss, "Mean Nucleus Area [px]", meanNucleusArea(a.nuclei));

    row(oss, "Mean LDs per Nucleus Red", meanPerNucleus(a.red));
    row(oss, "Mean LDs per Nucleus Green", meanPerNucleus(a.green));
    row(oss, "Mean LDs per Nucleus Colocalized", meanPerNucleus(a.colocalized));
    row(oss, "Mean LDs per Nucleus Diffuse", meanPerNucleus(a.diffuse));

    row(oss, "Num LDs Red", std::to_string(R.count));
    row(oss, "Num LDs Green", std::to_string(G.count));
    row(oss, "Num LDs Colocalized", std::to_string(C.count));
    row(oss, "Num LDs Diffuse", std::to_string(D.count));

    row(oss, "Mean LD Area Red", R.meanArea);
    row(oss, "Mean LD Area Green", G.meanArea);
    row(oss, "Mean LD Area Coloc", C.meanArea);
    row(oss, "Mean LD Area Diffuse", D.meanArea);

    row(oss, "Total LD Area Red", R.totalArea);
    row(oss, "Total LD Area Green", G.totalArea);
    row(oss, "Total LD Area Coloc", C.totalArea);
    row(oss, "Total LD Area Diffuse", D.totalArea);

    row(oss, "Mean Intensity Red", R.meanIntensity);
    row(oss, "Mean Intensity Green", G.meanIntensity);
    row(oss, "Mean Intensity Coloc", C.meanIntensity);
    row(oss, "Mean Intensity Diffuse", D.meanIntensity);

    row(oss, "Std Intensity Red", R.stdIntensity);
    row(oss, "Std Intensity Green", G.stdIntensity);
    row(oss, "Std Intensity Coloc", C.stdIntensity);
    row(oss, "Std Intensity Diffuse", D.stdIntensity);

    row(oss, "Global MeanRatio (Red/Green)", meanRedGreenRatio(a.red.regions));
    row(oss, "Pearson Colocalization", a.metrics.pearson);
    row(oss, "Manders M1", a.metrics.mandersM1);
    row(oss, "Manders M2", a.metrics.mandersM2);
    row(oss, "Overlap Colocalization", a.metrics.overlap);
    row(oss, "Pearson p-value", a.metrics.pValue);
    return oss.str();
}

std::string ReportWriter::lipidNuclei(const LipidAnalysis& a) const
{
    const NucleusGroups red = a.red.groups();
    const NucleusGroups green = a.green.groups();
    const NucleusGroups coloc = a.colocalized.groups();
    const NucleusGroups diffuse = a.diffuse.groups();

    std::ostringstream oss;
    oss << "NucleusID,NucleusArea,NumLDs_Red,NumLDs_Green,NumLDs_Coloc,NumLDs_Diffuse,"
           "CellLine,Dose,Nanoparticles\n";
    for (size_t i = 0; i < a.nuclei.nuclei.size(); ++i) {
        const auto& n = a.nuclei.nuclei[i];
        oss << n.id << ',' << n.area << ','
            << red[i].size() << ',' << green[i].size() << ','
            << coloc[i].size() << ',' << diffuse[i].size() << ','
            << csvField(meta_.cellLine) << ',' << csvField(meta_.dose) << ','
            << csvField(meta_.nanoparticles) << '\n';
    }
    return oss.str();
}

std::string ReportWriter::lipidObjects(const LipidAnalysis& a) const
{
    std::ostringstream oss;
    oss << objectHeader();
    objectRows(oss, a.red);
    objectRows(oss, a.green);
    objectRows(oss, a.colocalized);
    objectRows(oss, a.diffuse);
    return oss.str();
}

/* ---------- ROS ---------------------------------------------------- */
std::string ReportWriter::rosGlobal(const RosAnalysis& a) const
{
    const SpeciesSummary R = summarize(a.punctate.regions, IntensitySource::Green);
    const SpeciesSummary D = summarize(a.diffuse.regions, IntensitySource::Green);

    std::ostringstream oss;
    oss << "Metric,Value\n";
    row(oss, "Filename", csvField(meta_.filename));
    row(oss, "Cell Line", csvField(meta_.cellLine));
    row(oss, "Dose", csvField(meta_.dose));
    row(oss, "NPs", csvField(meta_.nanoparticles));
    row(oss, "Num Nuclei", std::to_string(a.nuclei.count()));
    row(oss, "Mean Nucleus Area [px]", meanNucleusArea(a.nuclei));
    row(oss, "Num ROS", std::to_string(R.count));
    row(oss, "Num ROS Diffuse", std::to_string(D.count));
    row(oss, "Mean ROS per Nucleus", meanPerNucleus(a.punctate));
    row(oss, "Mean ROS Diffuse per Nucleus", meanPerNucleus(a.diffuse));
    row(oss, "Mean ROS Area", R.meanArea);
    row(oss, "Mean ROS Area Diffuse", D.meanArea);
    row(oss, "Total ROS Area", R.totalArea);
    row(oss, "Total ROS Area Diffuse", D.totalArea);
    row(oss, "Mean ROS Eccentricity", R.meanEccentricity);
    row(oss, "Mean ROS Equiv Diameter", R.meanEquivDiameter);
    row(oss, "Mean ROS Intensity", R.meanIntensity);
    row(oss, "Std ROS Intensity", R.stdIntensity);
    row(oss, "Mean ROS Diffuse Intensity", D.meanIntensity);
    row(oss, "Std ROS Diffuse Intensity", D.stdIntensity);
    row(oss, "Total ROS Fluorescence", R.totalFluorescence);
    row(oss, "Total ROS Diffuse Fluorescence", D.totalFluorescence);
    return oss.str();
}

std::string ReportWriter::rosNuclei(const RosAnalysis& a) const
{
    const NucleusGroups punctate = a.punctate.groups();
    const NucleusGroups diffuse = a.diffuse.groups();

    std::ostringstream oss;
    oss << "NucleusID,NucleusArea,NumROS,NumROS_Diffuse,CellLine,Dose,Nanoparticles\n";
    for (size_t i = 0; i < a.nuclei.nuclei.size(); ++i) {
        const auto& n = a.nuclei.nuclei[i];
        oss << n.id << ',' << n.area << ','
            << punctate[i].size() << ',' << diffuse[i].size() << ','
            << csvField(meta_.cellLine) << ',' << csvField(meta_.dose) << ','
            << csvField(meta_.nanoparticles) << '\n';
    }
    return oss.str();
}

std::string ReportWriter::rosObjects(const RosAnalysis& a) const
{
    std::ostringstream oss;
    oss << objectHeader();
    objectRows(oss, a.punctate);
    objectRows(oss, a.diffuse);
    return oss.str();
}

/* ---------- запись на диск ----------------------------------------- */
void ReportWriter::writeFile(const std::string& path, const std::string& content)
{
    std::ofstream out(path);
    if (!out)
        throw std::runtime_error("[ReportWriter] cannot open " + path);
    out << content;
    if (!out)
        throw std::runtime_error("[ReportWriter] failed writing " + path);
}

std::vector<std::string> ReportWriter::writeLipid(const LipidAnalysis& a, const std::string& outDir) const
{
    namespace fs = std::filesystem;
    const fs::path base = fs::path(outDir) / (meta_.filename + "_LDReport");
    std::vector<std::string> paths = {base.string() + "_global.csv",
                                      base.string() + "_nuclei.csv",
                                      base.string() + "_objects.csv"};
    writeFile(paths[0], lipidGlobal(a));
    writeFile(paths[1], lipidNuclei(a));
    writeFile(paths[2], lipidObjects(a));
    std::cout << "[ReportWriter] LD report written: " << base.string() << "_*.csv" << std::endl;
    return paths;
}

std::vector<std::string> ReportWriter::writeReactiveOxygen(const RosAnalysis& a, const std::string& outDir) const
{
    namespace fs = std::filesystem;
    const fs::path base = fs::path(outDir) / (meta_.filename + "_ROSReport");
    std::vector<std::string> paths = {base.string() + "_global.csv",
                                      base.string() + "_nuclei.csv",
                                      base.string() + "_objects.csv"};
    writeFile(paths[0], rosGlobal(a));
    writeFile(paths[1], rosNuclei(a));
    writeFile(paths[2], rosObjects(a));
    std::cout << "[ReportWriter] ROS report written: " << base.string() << "_*.csv" << std::endl;
    return paths;
}

} // namespace cellquant
