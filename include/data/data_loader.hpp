/**
 * @file data_loader.hpp
 * @brief Analysis configuration and input discovery utilities
 *
 * Provides functionality to load the analysis configuration from JSON
 * files and to inspect a sales file (headers, sample records, column
 * roles, date samples) before an analysis run.
 */

#ifndef PVM_DATA_LOADER_HPP
#define PVM_DATA_LOADER_HPP

#include "bridge/bridge_calculator.hpp"
#include "data/chunk_source.hpp"
#include "data/csv_parser.hpp"
#include "data/record.hpp"
#include "periods/date.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>


namespace pvm {

/// Recommended maximum number of dimension columns.
constexpr size_t kMaxRecommendedDimensions = 4;

/// Records read by DataLoader::scan_file() by default.
constexpr size_t kDefaultScanRecords = 100;

/// Distinct values returned by DataLoader::extract_date_samples().
constexpr size_t kMaxDateSamples = 5;

/**
 * @struct InputConfig
 * @brief Where and how the input file is read
 */
struct InputConfig {
    std::string file;                          ///< Path to the delimited input file
    size_t chunk_size = data::kDefaultChunkSize; ///< Bytes per read
    char delimiter = ',';                      ///< Field separator

    /**
     * @brief Load from JSON object
     */
    static InputConfig from_json(const nlohmann::json& j);
};

/**
 * @struct ColumnMapping
 * @brief Roles of the input columns
 */
struct ColumnMapping {
    std::string date;                          ///< Transaction date column
    std::string sales;                         ///< Sales amount column
    std::string quantity;                      ///< Quantity column
    std::string cost;                          ///< Cost column (empty if not mapped)
    std::vector<std::string> dimensions;       ///< Ordered dimension columns

    static ColumnMapping from_json(const nlohmann::json& j);
};

/**
 * @enum PeriodType
 * @brief How the compared periods are defined
 */
enum class PeriodType {
    TWO_PERIOD,   ///< Explicit prior and current ranges
    FISCAL_YEAR,  ///< FY n against FY n-1
    LTM,          ///< Last twelve months against the preceding fiscal year
    MULTI_YEAR    ///< Chained bridges over consecutive fiscal years
};

PeriodType parse_period_type(const std::string& text);
std::string to_string(PeriodType type);

/**
 * @struct PeriodConfig
 * @brief Period definition of an analysis
 *
 * Fields that are not needed by the chosen type are ignored. Missing
 * current_fiscal_year and ltm_end_date are filled from the data date range.
 */
struct PeriodConfig {
    PeriodType type = PeriodType::TWO_PERIOD;
    int fiscal_year_end_month = 12;            ///< 1..12
    std::optional<periods::DateRange> prior;   ///< TWO_PERIOD
    std::optional<periods::DateRange> current; ///< TWO_PERIOD
    std::optional<int> current_fiscal_year;    ///< FISCAL_YEAR
    std::optional<periods::Date> ltm_end_date; ///< LTM
    std::vector<int> fiscal_years;             ///< MULTI_YEAR, ascending
    bool auto_fiscal_years = false;            ///< MULTI_YEAR: use every fully covered year

    static PeriodConfig from_json(const nlohmann::json& j);
};

/**
 * @struct OutputConfig
 * @brief Result export settings
 */
struct OutputConfig {
    std::string directory = "results";         ///< Output directory
    std::string sort_by = "total-desc";        ///< Detail sort order
    std::string filter;                        ///< Dimension value filter
    size_t top = 0;                            ///< Detail rows printed (0 = all)

    static OutputConfig from_json(const nlohmann::json& j);
};

/**
 * @struct AnalysisConfig
 * @brief Complete analysis configuration
 */
struct AnalysisConfig {
    InputConfig input;
    ColumnMapping columns;
    PeriodConfig periods;
    bridge::BridgeOptions bridge;
    OutputConfig output;
    std::string date_format = "auto";          ///< Catalog id or "auto"

    static AnalysisConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    /**
     * @brief Reject configurations that cannot run
     * @throws std::invalid_argument describing the first problem found
     */
    void validate() const;

    /**
     * @brief Load complete configuration from JSON file
     */
    static AnalysisConfig load_from_file(const std::string& config_path);
};

/**
 * @struct FileScan
 * @brief Header and leading records of an input file
 */
struct FileScan {
    std::vector<std::string> headers;
    std::vector<data::Record> records;
};

/**
 * @class DataLoader
 * @brief Loads configuration and inspects input files
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;

    // ========================================================================
    // Configuration
    // ========================================================================

    /**
     * @brief Load JSON document
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Load and validate analysis configuration
     *
     * @param config_path Path to JSON configuration file
     * @return AnalysisConfig object
     * @throws std::runtime_error if the file cannot be read or parsed
     * @throws std::invalid_argument if the configuration is invalid
     */
    static AnalysisConfig load_config(const std::string& config_path);

    // ========================================================================
    // Input Discovery
    // ========================================================================

    /**
     * @brief Open a delimited file as a record source
     */
    static std::unique_ptr<data::FileChunkSource> open_file(const InputConfig& input);

    /**
     * @brief Read the header and the first records of a source
     *
     * Stops as soon as max_records records have been delivered.
     */
    static FileScan scan_source(data::RecordSource& source,
                                size_t max_records = kDefaultScanRecords);

    /**
     * @brief Read the header and the first records of a delimited file
     * @throws std::runtime_error if the file cannot be read
     */
    static FileScan scan_file(const InputConfig& input,
                              size_t max_records = kDefaultScanRecords);

    /**
     * @brief Guess column roles from header names and sample records
     *
     * Each role takes the first header matched by the first of its ordered,
     * case-insensitive patterns that matches an unused header. Remaining
     * columns whose sampled values are not all numeric become dimensions.
     */
    static ColumnMapping detect_column_mappings(const std::vector<std::string>& headers,
                                                const std::vector<data::Record>& samples);

    /**
     * @brief Distinct, trimmed, non-blank values of the date column
     */
    static std::vector<std::string> extract_date_samples(const std::vector<data::Record>& samples,
                                                         const std::string& date_column,
                                                         size_t max_samples = kMaxDateSamples);
};

} // namespace pvm

#endif // PVM_DATA_LOADER_HPP
