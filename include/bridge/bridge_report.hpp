/**
 * @file bridge_report.hpp
 * @brief Console and file output of a bridge result
 */

#ifndef PVM_BRIDGE_BRIDGE_REPORT_HPP
#define PVM_BRIDGE_BRIDGE_REPORT_HPP

#include "aggregation/aggregation_result.hpp"
#include "bridge/bridge_calculator.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace pvm {
namespace bridge {

/**
 * @class BridgeReport
 * @brief Renders a BridgeResult for people and for other tools
 *
 * Files written by write_all():
 * - summary.csv      one row per bridge step
 * - detail.csv       one row per (bucket, step)
 * - negatives.csv    the non-positive rows ledger per period
 * - assumptions.json configuration, methodology, periods, run statistics
 * - bridge.json      the complete result
 *
 * CSV fields are quoted with the same rules the input parser reads, so
 * the files round-trip through it unchanged.
 */
class BridgeReport {
public:
    BridgeReport(const BridgeResult &result,
                 const aggregation::AggregationResult &aggregation,
                 nlohmann::json configuration = nlohmann::json::object());

    void print_summary(std::ostream &out = std::cout) const;

    /**
     * @brief Print the primary step of each row
     * @param top Maximum rows printed (0 = all)
     */
    void print_detail(const std::vector<BucketBridge> &rows, size_t top = 0,
                      std::ostream &out = std::cout) const;

    void export_summary_csv(const std::string &filepath) const;
    void export_detail_csv(const std::string &filepath, const std::vector<BucketBridge> &rows) const;
    void export_negatives_csv(const std::string &filepath) const;
    void export_assumptions_json(const std::string &filepath) const;

    nlohmann::json assumptions_json() const;
    nlohmann::json to_json() const;

    /**
     * @brief Write every output file into a directory (created if needed)
     * @return Paths written
     * @throws std::runtime_error if a file cannot be written
     */
    std::vector<std::string> write_all(const std::string &directory,
                                       const std::vector<BucketBridge> &rows) const;

private:
    const BridgeResult &result_;
    const aggregation::AggregationResult &aggregation_;
    nlohmann::json configuration_;
};

} // namespace bridge
} // namespace pvm

#endif // PVM_BRIDGE_BRIDGE_REPORT_HPP
