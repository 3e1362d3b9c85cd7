/**
 * @file bridge_report.cpp
 * @brief Implementation of BridgeReport
 */

#include "bridge/bridge_report.hpp"
#include "data/field_parsing.hpp"
#include "periods/date.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace pvm {
namespace bridge {

namespace {

// Dimension values are raw input bytes; invalid UTF-8 becomes U+FFFD
std::string dump_json(const nlohmann::json &j)
{
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::ofstream open_output(const std::string &filepath)
{
    std::filesystem::path path(filepath);
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(filepath);
    if (!file.is_open())
    {
        throw std::runtime_error("Could not open file for writing: " + filepath);
    }
    file << std::fixed << std::setprecision(6);
    return file;
}

nlohmann::json period_values_json(const PeriodValues &v)
{
    return nlohmann::json{
        {"label", v.label},
        {"value", v.value},
        {"price", v.price},
        {"volume", v.volume},
        {"sales", v.sales},
        {"cost", v.cost},
        {"count", v.count}};
}

nlohmann::json impacts_json(const BridgeImpacts &i)
{
    return nlohmann::json{
        {"total_change", i.total_change},
        {"price", i.price},
        {"volume", i.volume},
        {"mix", i.mix},
        {"cost", i.cost}};
}

nlohmann::json stats_json(const aggregation::RunStatistics &s)
{
    return nlohmann::json{
        {"total_rows", s.total_rows},
        {"included_rows", s.included_rows},
        {"excluded_rows", s.excluded_rows},
        {"parse_errors", s.parse_errors},
        {"outside_period_rows", s.outside_period_rows},
        {"negative_rows", s.negative_rows},
        {"unique_keys", s.unique_keys},
        {"period_rows", s.period_rows}};
}

nlohmann::json periods_json(const std::vector<aggregation::PeriodWindow> &windows)
{
    nlohmann::json out = nlohmann::json::array();
    for (const auto &w : windows)
    {
        nlohmann::json p{
            {"label", w.label},
            {"start", periods::to_iso_string(w.range.start)},
            {"end", periods::to_iso_string(w.range.end)},
            {"fully_covered", w.fully_covered}};
        if (w.fiscal_year != 0)
            p["fiscal_year"] = w.fiscal_year;
        out.push_back(p);
    }
    return out;
}

void write_period_columns(std::ostream &file, const PeriodValues &v)
{
    file << v.sales << "," << v.cost << "," << v.volume << "," << v.value << "," << v.price << "," << v.count;
}

} // namespace

BridgeReport::BridgeReport(const BridgeResult &result,
                           const aggregation::AggregationResult &aggregation,
                           nlohmann::json configuration)
    : result_(result), aggregation_(aggregation), configuration_(std::move(configuration))
{
}

void BridgeReport::print_summary(std::ostream &out) const
{
    Methodology m = BridgeCalculator::methodology(result_.options);
    const auto &s = aggregation_.stats;

    out << "\n=== " << m.title << " ===\n";
    out << "Rows read: " << s.total_rows << "  Included: " << s.included_rows
        << "  Excluded: " << s.excluded_rows << "\n";
    out << "  Parse errors: " << s.parse_errors << "  Outside periods: " << s.outside_period_rows
        << "  Non-positive: " << s.negative_rows << "\n";
    out << "Buckets: " << s.unique_keys << "\n";

    out << std::fixed << std::setprecision(2);
    for (const auto &step : result_.summaries)
    {
        out << "\n--- " << step.label << " ---\n";
        out << std::left << std::setw(16) << (step.from.label + " value:") << std::right << std::setw(18)
            << step.from.value << "\n";
        out << std::left << std::setw(16) << "Price:" << std::right << std::setw(18) << step.impacts.price
            << "  (" << step.price_pct << "%)\n";
        out << std::left << std::setw(16) << "Volume:" << std::right << std::setw(18) << step.impacts.volume
            << "  (" << step.volume_pct << "%)\n";
        out << std::left << std::setw(16) << "Mix:" << std::right << std::setw(18) << step.impacts.mix
            << "  (" << step.mix_pct << "%)\n";
        if (result_.options.separate_cost())
        {
            out << std::left << std::setw(16) << "Cost:" << std::right << std::setw(18) << step.impacts.cost
                << "  (" << step.cost_pct << "%)\n";
        }
        out << std::left << std::setw(16) << (step.to.label + " value:") << std::right << std::setw(18)
            << step.to.value << "\n";
        out << "Total change: " << step.impacts.total_change << " (" << step.change_pct << "%)\n";
        out << "Items: " << step.counts.total << "  continuing " << step.counts.continuing << ", new "
            << step.counts.new_items << ", discontinued " << step.counts.discontinued << "\n";
    }
    out << "==========================\n";
}

void BridgeReport::print_detail(const std::vector<BucketBridge> &rows, size_t top, std::ostream &out) const
{
    size_t limit = top == 0 ? rows.size() : std::min(top, rows.size());

    out << std::fixed << std::setprecision(2);
    out << std::left << std::setw(32) << "Bucket" << std::setw(14) << "Class" << std::right
        << std::setw(16) << "Total" << std::setw(16) << "Price" << std::setw(16) << "Volume"
        << std::setw(16) << "Mix" << "\n";

    for (size_t i = 0; i < limit; ++i)
    {
        const auto &row = rows[i];
        if (row.steps.empty())
            continue;

        std::string name;
        for (size_t d = 0; d < row.dimension_values.size(); ++d)
        {
            if (d > 0)
                name += " | ";
            name += row.dimension_values[d];
        }
        if (name.empty())
            name = "Total";

        const auto &step = row.primary_step();
        out << std::left << std::setw(32) << name << std::setw(14) << to_string(step.classification)
            << std::right << std::setw(16) << step.impacts.total_change << std::setw(16) << step.impacts.price
            << std::setw(16) << step.impacts.volume << std::setw(16) << step.impacts.mix << "\n";
    }

    if (limit < rows.size())
    {
        out << "... " << rows.size() - limit << " more\n";
    }
}

void BridgeReport::export_summary_csv(const std::string &filepath) const
{
    auto file = open_output(filepath);

    file << "step,from_period,to_period,from_value,to_value,total_change,price_impact,volume_impact,"
            "mix_impact,cost_impact,price_pct,volume_pct,mix_pct,cost_pct,change_pct,items,new,"
            "discontinued,continuing\n";

    for (const auto &s : result_.summaries)
    {
        file << data::quote_field(s.key) << ","
             << data::quote_field(s.from.label) << ","
             << data::quote_field(s.to.label) << ","
             << s.from.value << ","
             << s.to.value << ","
             << s.impacts.total_change << ","
             << s.impacts.price << ","
             << s.impacts.volume << ","
             << s.impacts.mix << ","
             << s.impacts.cost << ","
             << s.price_pct << ","
             << s.volume_pct << ","
             << s.mix_pct << ","
             << s.cost_pct << ","
             << s.change_pct << ","
             << s.counts.total << ","
             << s.counts.new_items << ","
             << s.counts.discontinued << ","
             << s.counts.continuing << "\n";
    }
}

void BridgeReport::export_detail_csv(const std::string &filepath, const std::vector<BucketBridge> &rows) const
{
    auto file = open_output(filepath);

    std::vector<std::string> dimension_columns = result_.dimension_columns;
    if (dimension_columns.empty())
        dimension_columns.push_back("dimension");

    for (const auto &column : dimension_columns)
        file << data::quote_field(column) << ",";
    file << "step,classification,"
            "from_sales,from_cost,from_volume,from_value,from_price,from_count,"
            "to_sales,to_cost,to_volume,to_value,to_price,to_count,"
            "total_change,price_impact,volume_impact,mix_impact,cost_impact\n";

    for (const auto &row : rows)
    {
        for (const auto &step : row.steps)
        {
            if (row.dimension_values.empty())
            {
                file << "Total,";
            }
            else
            {
                for (const auto &value : row.dimension_values)
                    file << data::quote_field(value) << ",";
            }

            file << data::quote_field(step.key) << "," << to_string(step.classification) << ",";
            write_period_columns(file, step.from);
            file << ",";
            write_period_columns(file, step.to);
            file << "," << step.impacts.total_change
                 << "," << step.impacts.price
                 << "," << step.impacts.volume
                 << "," << step.impacts.mix
                 << "," << step.impacts.cost << "\n";
        }
    }
}

void BridgeReport::export_negatives_csv(const std::string &filepath) const
{
    auto file = open_output(filepath);

    file << "period,start,end,count,sales,quantity,cost\n";
    for (size_t slot = 0; slot < aggregation_.periods.size(); ++slot)
    {
        const auto &window = aggregation_.periods[slot];
        aggregation::PeriodAccumulator ledger;
        if (slot < aggregation_.negatives.size())
            ledger = aggregation_.negatives[slot];

        file << data::quote_field(window.label) << ","
             << periods::to_iso_string(window.range.start) << ","
             << periods::to_iso_string(window.range.end) << ","
             << ledger.count << ","
             << ledger.sales << ","
             << ledger.quantity << ","
             << ledger.cost << "\n";
    }
}

nlohmann::json BridgeReport::assumptions_json() const
{
    Methodology m = BridgeCalculator::methodology(result_.options);

    nlohmann::json formulas = nlohmann::json::array();
    for (const auto &[name, formula] : m.formulas)
    {
        formulas.push_back({{"name", name}, {"formula", formula}});
    }

    nlohmann::json j;
    j["configuration"] = configuration_;
    j["bridge"] = result_.options.to_json();
    j["methodology"] = {
        {"title", m.title},
        {"description", m.description},
        {"formulas", formulas},
        {"notes", m.notes}};
    j["periods"] = periods_json(aggregation_.periods);
    j["statistics"] = stats_json(aggregation_.stats);
    j["exclusion_rules"] = {
        "Rows with an unparseable date, sales, quantity or cost are counted as parse errors",
        "Rows dated outside every analysis period are counted as outside periods",
        "Rows with sales <= 0 or quantity <= 0 are excluded from the bridge and listed in negatives.csv",
        "Blank dimension values are reported as Unknown"};

    if (aggregation_.min_date && aggregation_.max_date)
    {
        j["data_range"] = {
            {"min_date", periods::to_iso_string(*aggregation_.min_date)},
            {"max_date", periods::to_iso_string(*aggregation_.max_date)}};
    }
    return j;
}

void BridgeReport::export_assumptions_json(const std::string &filepath) const
{
    auto file = open_output(filepath);
    file << dump_json(assumptions_json()) << "\n";
}

nlohmann::json BridgeReport::to_json() const
{
    nlohmann::json j;
    j["mode"] = result_.mode == aggregation::PeriodMode::MULTI_YEAR ? "multi_year" : "two_period";
    j["options"] = result_.options.to_json();
    j["dimension_columns"] = result_.dimension_columns;
    j["periods"] = periods_json(result_.periods);
    j["statistics"] = stats_json(aggregation_.stats);

    nlohmann::json summaries = nlohmann::json::array();
    for (const auto &s : result_.summaries)
    {
        summaries.push_back({
            {"key", s.key},
            {"label", s.label},
            {"from", period_values_json(s.from)},
            {"to", period_values_json(s.to)},
            {"impacts", impacts_json(s.impacts)},
            {"price_pct", s.price_pct},
            {"volume_pct", s.volume_pct},
            {"mix_pct", s.mix_pct},
            {"cost_pct", s.cost_pct},
            {"change_pct", s.change_pct},
            {"counts", {{"total", s.counts.total},
                        {"new", s.counts.new_items},
                        {"discontinued", s.counts.discontinued},
                        {"continuing", s.counts.continuing}}}});
    }
    j["summaries"] = summaries;

    nlohmann::json detail = nlohmann::json::array();
    for (const auto &row : result_.detail)
    {
        nlohmann::json steps = nlohmann::json::array();
        for (const auto &step : row.steps)
        {
            steps.push_back({
                {"key", step.key},
                {"classification", to_string(step.classification)},
                {"from", period_values_json(step.from)},
                {"to", period_values_json(step.to)},
                {"impacts", impacts_json(step.impacts)}});
        }
        detail.push_back({
            {"key", row.key},
            {"dimensions", row.dimension_values},
            {"steps", steps}});
    }
    j["detail"] = detail;

    nlohmann::json negatives = nlohmann::json::array();
    for (size_t slot = 0; slot < aggregation_.negatives.size() && slot < aggregation_.periods.size(); ++slot)
    {
        const auto &n = aggregation_.negatives[slot];
        negatives.push_back({
            {"period", aggregation_.periods[slot].label},
            {"count", n.count},
            {"sales", n.sales},
            {"quantity", n.quantity},
            {"cost", n.cost}});
    }
    j["negatives"] = negatives;

    return j;
}

std::vector<std::string> BridgeReport::write_all(const std::string &directory,
                                                 const std::vector<BucketBridge> &rows) const
{
    std::filesystem::create_directories(directory);
    std::filesystem::path dir(directory);

    std::vector<std::string> written;

    auto summary = (dir / "summary.csv").string();
    export_summary_csv(summary);
    written.push_back(summary);

    auto detail = (dir / "detail.csv").string();
    export_detail_csv(detail, rows);
    written.push_back(detail);

    auto negatives = (dir / "negatives.csv").string();
    export_negatives_csv(negatives);
    written.push_back(negatives);

    auto assumptions = (dir / "assumptions.json").string();
    export_assumptions_json(assumptions);
    written.push_back(assumptions);

    auto full = (dir / "bridge.json").string();
    {
        auto file = open_output(full);
        file << dump_json(to_json()) << "\n";
    }
    written.push_back(full);

    return written;
}

} // namespace bridge
} // namespace pvm
