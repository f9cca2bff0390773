#ifndef REPORTGENERATOR_H
#define REPORTGENERATOR_H

#include "../../include/crm_types.hpp"
#include "../core/CarManager.h"
#include "../core/CustomerManager.h"
#include "../core/RentalManager.h"
#include "../core/RentalService.h"
#include "../core/DateUtils.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
using namespace std;

// Plain-text and JSON summaries. Reads through the store contract only
// (list_active, scan_all, per-id lookups); dangling references are shown,
// never repaired.
class ReportGenerator
{
public:
    typedef vector<pair<string, size_t>> Columns;

private:
    CarManager &cars_;
    CustomerManager &customers_;
    RentalManager &rentals_;

    static string pad(const string &value, size_t width)
    {
        if (value.size() >= width)
            return value;
        return value + string(width - value.size(), ' ');
    }

    static string header_line(const Columns &columns)
    {
        string line;
        for (size_t i = 0; i < columns.size(); i++)
        {
            if (i > 0)
                line += " | ";
            line += pad(columns[i].first, columns[i].second);
        }
        return line;
    }

    static string rule_for(const Columns &columns)
    {
        size_t width = 0;
        for (const auto &column : columns)
            width += column.second;
        return string(width + columns.size() * 3, '-');
    }

    static string row(const Columns &columns, const vector<string> &cells)
    {
        string line;
        for (size_t i = 0; i < columns.size() && i < cells.size(); i++)
        {
            if (i > 0)
                line += " | ";
            line += pad(cells[i], columns[i].second);
        }
        return line;
    }

    static string current_time_string()
    {
        time_t now = time(nullptr);
        struct tm local;
        localtime_r(&now, &local);
        char buffer[32];
        strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
        return string(buffer);
    }

    static string centered(const string &title, size_t width)
    {
        if (title.size() >= width)
            return title;
        return string((width - title.size()) / 2, ' ') + title;
    }

    bool write_file(const string &path, const string &content, const string &label)
    {
        filesystem::path parent = filesystem::path(path).parent_path();
        if (!parent.empty())
        {
            error_code ec;
            filesystem::create_directories(parent, ec);
            if (ec)
            {
                cerr << "Error creating report directory " << parent.string() << ": " << ec.message() << endl;
                return false;
            }
        }

        ofstream out(path, ios::out | ios::trunc);
        if (!out.is_open())
        {
            cerr << "Error writing " << label << " file: " << path << endl;
            return false;
        }
        out << content;
        out.flush();
        if (!out)
        {
            cerr << "Error writing " << label << " file: " << path << endl;
            return false;
        }
        cout << label << " written to '" << path << "'." << endl;
        return true;
    }

public:
    ReportGenerator(CarManager &cars, CustomerManager &customers, RentalManager &rentals)
        : cars_(cars), customers_(customers), rentals_(rentals) {}

    // 1234567.5 -> "1,234,567.50"
    static string format_money(double value)
    {
        ostringstream ss;
        ss << fixed << setprecision(2) << (value < 0 ? -value : value);
        string digits = ss.str();

        size_t dot = digits.find('.');
        string whole = digits.substr(0, dot);
        string grouped;
        int count = 0;
        for (size_t i = whole.size(); i > 0; i--)
        {
            grouped.insert(grouped.begin(), whole[i - 1]);
            if (++count % 3 == 0 && i > 1)
                grouped.insert(grouped.begin(), ',');
        }
        return (value < 0 ? "-" : "") + grouped + digits.substr(dot);
    }

    static string format_plain(double value)
    {
        ostringstream ss;
        ss << fixed << setprecision(2) << value;
        return ss.str();
    }

    // Brand is the first word of the model.
    static string brand_of(const string &model)
    {
        size_t space = model.find(' ');
        return space == string::npos ? model : model.substr(0, space);
    }

    // ========================================================================
    // STATISTICS
    // ========================================================================

    // Rented means the car's stored flag, the same one rental creation checks.
    FleetSummary compute_fleet_summary()
    {
        FleetSummary summary;

        auto slots = cars_.scan_all();
        summary.total_car_slots = slots.size();

        double rate_sum = 0;
        bool first = true;
        for (const auto &slot : slots)
        {
            const Car &car = slot.record;
            if (!car.is_active)
            {
                summary.deleted_cars++;
                continue;
            }

            summary.active_cars++;
            if (car.is_rented)
                summary.currently_rented++;

            rate_sum += car.daily_rate;
            if (first || car.daily_rate < summary.min_rate)
                summary.min_rate = car.daily_rate;
            if (first || car.daily_rate > summary.max_rate)
                summary.max_rate = car.daily_rate;
            first = false;
        }

        summary.available_now = summary.active_cars - summary.currently_rented;
        if (summary.active_cars > 0)
            summary.avg_rate = rate_sum / static_cast<double>(summary.active_cars);
        return summary;
    }

    map<string, uint64_t> count_active_cars_by_brand()
    {
        map<string, uint64_t> counts;
        for (const auto &car : cars_.list_active())
        {
            counts[brand_of(car.model)]++;
        }
        return counts;
    }

    // ========================================================================
    // TEXT REPORTS
    // ========================================================================

    string build_master_report()
    {
        vector<string> lines;
        const string title = "MASTER RENTAL SYSTEM REPORT";
        lines.push_back(string(70, '='));
        lines.push_back(centered(title, 70));
        lines.push_back(string(70, '='));
        lines.push_back("Generated On: " + current_time_string());
        lines.push_back(string(70, '-'));

        lines.push_back("");
        lines.push_back("--- ACTIVE CAR INVENTORY ---");
        Columns car_columns = {{"ID", 5}, {"Model", 30}, {"LicensePlate", 15}, {"DailyRate", 12}, {"Rented", 6}};
        auto cars = cars_.list_active();
        lines.push_back("Total Active Cars: " + to_string(cars.size()));
        lines.push_back(header_line(car_columns));
        lines.push_back(rule_for(car_columns));
        if (cars.empty())
        {
            lines.push_back("No active cars found.");
        }
        for (const auto &car : cars)
        {
            lines.push_back(row(car_columns, {to_string(car.car_id), car.model, car.license_plate,
                                              format_plain(car.daily_rate), car.is_rented ? "Yes" : "No"}));
        }

        lines.push_back("");
        lines.push_back("--- ACTIVE CUSTOMER DIRECTORY ---");
        Columns customer_columns = {{"ID", 5}, {"Name", 30}, {"Phone", 15}};
        auto customers = customers_.list_active();
        lines.push_back("Total Active Customers: " + to_string(customers.size()));
        lines.push_back(header_line(customer_columns));
        lines.push_back(rule_for(customer_columns));
        if (customers.empty())
        {
            lines.push_back("No active customers found.");
        }
        for (const auto &customer : customers)
        {
            lines.push_back(row(customer_columns, {to_string(customer.customer_id), customer.name, customer.phone}));
        }

        lines.push_back("");
        lines.push_back("--- ACTIVE RENTAL AGREEMENTS ---");
        Columns rental_columns = {{"ID", 5}, {"CustomerID", 10}, {"CarID", 7}, {"StartDate", 10}, {"EndDate", 10}, {"TotalPrice", 12}};
        auto rentals = rentals_.list_active();
        lines.push_back("Total Active Rentals: " + to_string(rentals.size()));
        lines.push_back(header_line(rental_columns));
        lines.push_back(rule_for(rental_columns));
        if (rentals.empty())
        {
            lines.push_back("No active rental agreements found.");
        }
        for (const auto &rental : rentals)
        {
            lines.push_back(row(rental_columns, {to_string(rental.rental_id), to_string(rental.customer_id),
                                                 to_string(rental.car_id), format_date_display(rental.start_date),
                                                 format_date_display(rental.end_date), format_plain(rental.total_price)}));
        }

        lines.push_back("");
        lines.push_back(string(70, '='));

        string content;
        for (const auto &line : lines)
            content += line + "\n";
        return content;
    }

    string build_rental_summary_report()
    {
        vector<string> lines;
        lines.push_back("RENTAL AGREEMENT SUMMARY");
        lines.push_back("Generated At : " + current_time_string());

        Columns columns = {{"ID", 5}, {"CustomerID", 10}, {"CarID", 7}, {"StartDate", 10}, {"Days", 5}, {"TotalPrice", 12}};
        auto rentals = rentals_.list_active();
        lines.push_back("Total Active Rentals: " + to_string(rentals.size()));
        lines.push_back(header_line(columns));
        lines.push_back(rule_for(columns));

        double revenue = 0;
        for (const auto &rental : rentals)
        {
            int64_t days = RentalService::billable_days(rental.start_date, rental.end_date);
            revenue += rental.total_price;
            lines.push_back(row(columns, {to_string(rental.rental_id), to_string(rental.customer_id),
                                          to_string(rental.car_id), format_date_display(rental.start_date),
                                          to_string(days), format_plain(rental.total_price)}));
        }
        if (rentals.empty())
        {
            lines.push_back("No active rental agreements found.");
        }
        lines.push_back(rule_for(columns));
        lines.push_back("Total Revenue (active): " + format_money(revenue));

        string content;
        for (const auto &line : lines)
            content += line + "\n";
        return content;
    }

    string build_detailed_summary_report()
    {
        vector<string> lines;
        lines.push_back("Detailed Rental Summary Report");
        lines.push_back("Generated At : " + current_time_string());
        lines.push_back("Endianness   : Little-Endian");
        lines.push_back("Encoding     : UTF-8 (fixed-length)");
        lines.push_back(string(120, '-'));

        Columns columns = {{"Cust ID", 8}, {"Name", 30}, {"Car ID", 6}, {"Model", 20},
                           {"Start Date", 10}, {"Return Date", 11}, {"Car Status", 10}, {"Rented", 8}};
        lines.push_back("ACTIVE RENTAL AGREEMENTS DETAIL:");
        lines.push_back(header_line(columns));
        lines.push_back(rule_for(columns));

        auto rentals = rentals_.list_active();
        for (const auto &rental : rentals)
        {
            auto customer = customers_.get(rental.customer_id);
            auto car = cars_.get(rental.car_id);

            string name = customer ? customer->name : "N/A (Deleted)";
            string model = car ? car->model : "N/A (Invalid)";
            string status = car ? "Active" : "Inactive";

            lines.push_back(row(columns, {to_string(rental.customer_id), name, to_string(rental.car_id), model,
                                          format_date_display(rental.start_date), format_date_display(rental.end_date),
                                          status, "Yes"}));
        }
        if (rentals.empty())
        {
            lines.push_back("No active rental agreements found.");
        }
        lines.push_back(string(120, '='));

        FleetSummary summary = compute_fleet_summary();
        lines.push_back("");
        lines.push_back("Summary (Active status overview)");
        lines.push_back("- Total Cars (records) : " + to_string(summary.total_car_slots));
        lines.push_back("- Active Cars          : " + to_string(summary.active_cars));
        lines.push_back("- Deleted Cars         : " + to_string(summary.deleted_cars));
        lines.push_back("- Currently Rented     : " + to_string(summary.currently_rented));
        lines.push_back("- Available Now        : " + to_string(summary.available_now));

        lines.push_back("");
        lines.push_back("Rate Statistics (per day, Active only)");
        lines.push_back("- Min : " + format_money(summary.min_rate));
        lines.push_back("- Max : " + format_money(summary.max_rate));
        lines.push_back("- Avg : " + format_money(summary.avg_rate));

        lines.push_back("");
        lines.push_back("Cars by Brand (Active only)");
        auto brands = count_active_cars_by_brand();
        if (brands.empty())
        {
            lines.push_back("No active models found.");
        }
        for (const auto &entry : brands)
        {
            lines.push_back("- " + entry.first + " : " + to_string(entry.second));
        }

        lines.push_back("");
        lines.push_back(string(120, '='));

        string content;
        for (const auto &line : lines)
            content += line + "\n";
        return content;
    }

    // ========================================================================
    // JSON SNAPSHOT
    // ========================================================================

    nlohmann::json build_snapshot()
    {
        using json = nlohmann::json;

        json cars = json::array();
        for (const auto &car : cars_.list_active())
        {
            cars.push_back({{"id", car.car_id},
                            {"model", car.model},
                            {"license_plate", car.license_plate},
                            {"daily_rate", car.daily_rate},
                            {"is_rented", car.is_rented}});
        }

        json customers = json::array();
        for (const auto &customer : customers_.list_active())
        {
            customers.push_back({{"id", customer.customer_id},
                                 {"name", customer.name},
                                 {"phone", customer.phone}});
        }

        json rentals = json::array();
        for (const auto &rental : rentals_.list_active())
        {
            rentals.push_back({{"id", rental.rental_id},
                               {"customer_id", rental.customer_id},
                               {"car_id", rental.car_id},
                               {"start_date", rental.start_date},
                               {"end_date", rental.end_date},
                               {"total_price", rental.total_price}});
        }

        return {{"generated_at", current_time_string()},
                {"cars", cars},
                {"customers", customers},
                {"rentals", rentals}};
    }

    bool generate_master_report(const string &path)
    {
        return write_file(path, build_master_report(), "Master report");
    }

    bool generate_rental_summary_report(const string &path)
    {
        return write_file(path, build_rental_summary_report(), "Rental summary report");
    }

    bool generate_detailed_summary_report(const string &path)
    {
        return write_file(path, build_detailed_summary_report(), "Detailed summary report");
    }

    bool export_json_snapshot(const string &path)
    {
        return write_file(path, build_snapshot().dump(4) + "\n", "JSON snapshot");
    }
};

#endif
