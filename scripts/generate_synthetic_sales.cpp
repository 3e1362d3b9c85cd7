/**
 * @file generate_synthetic_sales.cpp
 * @brief Generate a synthetic sales file for the PVM bridge
 */

#include "data/field_parsing.hpp"
#include "periods/date.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace pvm;

struct Product {
    std::string name;
    std::string category;
    double base_price;       // price in the first year
    double annual_inflation; // price growth per year
    double unit_cost_ratio;  // cost as a share of price
    int first_year_offset;   // 0 = sold from the start
    int last_year_offset;    // sold through this year offset
};

int main(int argc, char* argv[]) {
    std::cout << "\n=== Synthetic Sales Generator ===\n" << std::endl;

    std::vector<std::string> regions = {"North", "South", "East", "West"};
    std::vector<Product> products = {
        {"Widget",      "Hardware", 25.0,  0.04, 0.55, 0, 99},
        {"Gadget",      "Hardware", 120.0, 0.02, 0.60, 0, 99},
        {"Gizmo, Pro",  "Hardware", 310.0, 0.06, 0.50, 0, 99},
        {"Support Plan","Services", 80.0,  0.03, 0.30, 0, 99},
        {"Legacy Kit",  "Hardware", 45.0,  0.00, 0.70, 0, 1},
        {"Cloud Seat",  "Services", 15.0,  0.05, 0.20, 1, 99}
    };

    std::string output_file = "data/sales/synthetic_sales.csv";
    size_t num_rows = 50000;
    int start_year = 2021;
    int num_years = 4;
    unsigned int seed = 42;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--output" && i + 1 < argc) {
            output_file = argv[++i];
        } else if (arg == "--rows" && i + 1 < argc) {
            num_rows = std::stoul(argv[++i]);
        } else if (arg == "--start-year" && i + 1 < argc) {
            start_year = std::stoi(argv[++i]);
        } else if (arg == "--years" && i + 1 < argc) {
            num_years = std::stoi(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = static_cast<unsigned int>(std::stoul(argv[++i]));
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                      << "Options:\n"
                      << "  --output FILE      Output CSV file (default: data/sales/synthetic_sales.csv)\n"
                      << "  --rows N           Number of rows (default: 50000)\n"
                      << "  --start-year YEAR  First calendar year (default: 2021)\n"
                      << "  --years N          Number of years (default: 4)\n"
                      << "  --seed N           Random seed (default: 42)\n"
                      << "  --help             Show this help\n";
            return 0;
        }
    }

    if (num_years < 1) {
        std::cerr << "Error: --years must be at least 1" << std::endl;
        return 1;
    }

    periods::Date first{start_year, 1, 1};
    periods::Date last{start_year + num_years - 1, 12, 31};
    long long span = last.to_days() - first.to_days() + 1;

    std::cout << "Generating " << num_rows << " rows from " << periods::to_iso_string(first)
              << " to " << periods::to_iso_string(last) << "..." << std::endl;

    std::filesystem::path path(output_file);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream file(output_file);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open file for writing: " << output_file << std::endl;
        return 1;
    }

    std::mt19937 gen(seed);
    std::uniform_int_distribution<long long> day_dist(0, span - 1);
    std::uniform_int_distribution<size_t> region_dist(0, regions.size() - 1);
    std::uniform_int_distribution<size_t> product_dist(0, products.size() - 1);
    std::uniform_int_distribution<int> qty_dist(1, 40);
    std::normal_distribution<double> noise(0.0, 0.05);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    file << "region,product,category,date,sales,quantity,cost\n";
    file << std::fixed << std::setprecision(2);

    size_t written = 0;
    size_t returns = 0;
    while (written < num_rows) {
        periods::Date date = first.add_days(day_dist(gen));
        int year_offset = date.year - start_year;

        const Product& product = products[product_dist(gen)];
        if (year_offset < product.first_year_offset || year_offset > product.last_year_offset) {
            continue;
        }

        double price = product.base_price * std::pow(1.0 + product.annual_inflation, year_offset) *
                       (1.0 + noise(gen));
        int quantity = qty_dist(gen);

        // A small share of rows are returns or blank regions
        bool is_return = unit(gen) < 0.01;
        if (is_return) {
            quantity = -quantity;
            ++returns;
        }
        std::string region = unit(gen) < 0.005 ? "" : regions[region_dist(gen)];

        double sales = price * quantity;
        double cost = sales * product.unit_cost_ratio;

        file << data::quote_field(region) << ","
             << data::quote_field(product.name) << ","
             << data::quote_field(product.category) << ","
             << periods::to_iso_string(date) << ","
             << sales << ","
             << quantity << ","
             << cost << "\n";
        ++written;
    }

    std::cout << "\n=== Generated Data Summary ===\n";
    std::cout << "Rows:     " << written << "\n";
    std::cout << "Returns:  " << returns << "\n";
    std::cout << "Regions:  " << regions.size() << "\n";
    std::cout << "Products: " << products.size() << "\n";

    std::cout << "\nData generation complete.\n" << std::endl;
    std::cout << "You can now run:\n";
    std::cout << "  ./build/bin/pvm_bridge_cli --config data/config/analysis_config.json --verbose\n";
    std::cout << std::endl;

    return 0;
}
