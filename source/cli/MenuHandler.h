#ifndef MENUHANDLER_H
#define MENUHANDLER_H

#include "../../include/crm_types.hpp"
#include "../../include/crm_errors.hpp"
#include "../../include/crm_config.hpp"
#include "../core/BinaryCodec.h"
#include "../core/CarManager.h"
#include "../core/CustomerManager.h"
#include "../core/RentalManager.h"
#include "../core/RentalService.h"
#include "../core/DateUtils.h"
#include "../reports/ReportGenerator.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>
using namespace std;

// Interactive menus over an arbitrary stream pair. Every prompt returns
// false once input is exhausted, which unwinds to the caller as if X had
// been chosen.
class MenuHandler
{
private:
    CarManager &cars_;
    CustomerManager &customers_;
    RentalManager &rentals_;
    RentalService &rental_service_;
    ReportGenerator &reports_;
    const CRMConfig &config_;
    istream &in_;
    ostream &out_;

    bool read_line(const string &prompt, string &line)
    {
        out_ << prompt << flush;
        if (!getline(in_, line))
        {
            return false;
        }
        line = wire::trim(line);
        return true;
    }

    bool get_user_choice(const string &prompt, const vector<string> &valid, string &choice)
    {
        while (true)
        {
            string line;
            if (!read_line(prompt, line))
                return false;

            transform(line.begin(), line.end(), line.begin(),
                      [](unsigned char c) { return static_cast<char>(toupper(c)); });
            if (find(valid.begin(), valid.end(), line) != valid.end())
            {
                choice = line;
                return true;
            }
            out_ << "Invalid choice, please try again." << endl;
        }
    }

    bool get_int_input(const string &prompt, int32_t &value)
    {
        while (true)
        {
            string line;
            if (!read_line(prompt, line))
                return false;

            try
            {
                size_t used = 0;
                long long parsed = stoll(line, &used);
                if (used == line.size() &&
                    parsed >= numeric_limits<int32_t>::min() &&
                    parsed <= numeric_limits<int32_t>::max())
                {
                    value = static_cast<int32_t>(parsed);
                    return true;
                }
            }
            catch (const logic_error &)
            {
                // invalid_argument / out_of_range: ask again
            }
            out_ << "Please enter a whole number." << endl;
        }
    }

    bool get_float_input(const string &prompt, double &value)
    {
        while (true)
        {
            string line;
            if (!read_line(prompt, line))
                return false;

            try
            {
                size_t used = 0;
                double parsed = stod(line, &used);
                if (used == line.size() && isfinite(parsed))
                {
                    value = parsed;
                    return true;
                }
            }
            catch (const logic_error &)
            {
                // invalid_argument / out_of_range: ask again
            }
            out_ << "Please enter a number." << endl;
        }
    }

    bool get_date_input(const string &prompt, int32_t &value)
    {
        while (true)
        {
            string line;
            if (!read_line(prompt, line))
                return false;

            try
            {
                value = parse_date_input(line);
                return true;
            }
            catch (const ValidationError &e)
            {
                out_ << e.what() << endl;
            }
        }
    }

    bool get_text_input(const string &prompt, size_t width, string &value)
    {
        string line;
        if (!read_line(prompt, line))
            return false;
        value = wire::trim(wire::truncate_utf8(line, width));
        return true;
    }

    static string money(double value)
    {
        ostringstream ss;
        ss << fixed << setprecision(2) << value;
        return ss.str();
    }

    string describe(const Car &car)
    {
        ostringstream ss;
        ss << "ID: " << car.car_id << " | Model: " << left << setw(30) << car.model
           << " | Plate: " << setw(10) << car.license_plate
           << " | Rate: " << money(car.daily_rate)
           << " | Rented: " << (car.is_rented ? "Yes" : "No");
        return ss.str();
    }

    string describe(const Customer &customer)
    {
        ostringstream ss;
        ss << "ID: " << customer.customer_id << " | Name: " << left << setw(30) << customer.name
           << " | Phone: " << customer.phone;
        return ss.str();
    }

    string describe(const Rental &rental)
    {
        ostringstream ss;
        ss << "ID: " << rental.rental_id << " | CustID: " << rental.customer_id
           << " | CarID: " << rental.car_id
           << " | Start: " << format_date_display(rental.start_date)
           << " | End: " << format_date_display(rental.end_date)
           << " | Total: " << money(rental.total_price);
        return ss.str();
    }

    // ========================================================================
    // CAR MENU
    // ========================================================================

    bool handle_car_operation(const string &choice)
    {
        if (choice == "A")
        {
            Car car;
            if (!get_int_input("Car ID: ", car.car_id) ||
                !get_text_input("Model (max 30 characters): ", CAR_MODEL_LEN, car.model) ||
                !get_text_input("License plate (max 10 characters): ", CAR_PLATE_LEN, car.license_plate) ||
                !get_float_input("Daily rate: ", car.daily_rate))
                return false;

            uint64_t offset = cars_.add(car);
            out_ << "Car ID " << car.car_id << " saved at offset " << offset << "." << endl;
        }
        else if (choice == "U")
        {
            int32_t car_id;
            double rate;
            if (!get_int_input("Car ID to update: ", car_id) ||
                !get_float_input("New daily rate: ", rate))
                return false;

            if (cars_.update_daily_rate(car_id, rate))
                out_ << "Car ID " << car_id << " updated." << endl;
            else
                out_ << "Car ID " << car_id << " not found or deleted." << endl;
        }
        else if (choice == "D")
        {
            int32_t car_id;
            if (!get_int_input("Car ID to delete: ", car_id))
                return false;

            if (cars_.remove(car_id))
                out_ << "Car ID " << car_id << " deleted." << endl;
            else
                out_ << "Car ID " << car_id << " not found or already deleted." << endl;
        }
        else if (choice == "V")
        {
            auto cars = cars_.list_active();
            if (cars.empty())
                out_ << "No active cars." << endl;
            for (const auto &car : cars)
                out_ << describe(car) << endl;
        }
        else if (choice == "S")
        {
            int32_t car_id;
            if (!get_int_input("Car ID to search: ", car_id))
                return false;

            auto found = cars_.find(car_id);
            if (found)
                out_ << "Found: " << describe(found->record) << " (Offset: " << found->offset << " bytes)" << endl;
            else
                out_ << "Car ID " << car_id << " not found or deleted." << endl;
        }
        return true;
    }

    bool run_car_menu()
    {
        while (true)
        {
            out_ << endl << "=== [1] Cars ===" << endl;
            out_ << "A: Add | U: Update rate | D: Delete" << endl;
            out_ << "V: View all | S: Search by ID" << endl;
            out_ << "X: Back to main menu" << endl;

            string choice;
            if (!get_user_choice(">> Choose: ", {"A", "U", "D", "V", "S", "X"}, choice))
                return false;
            if (choice == "X")
                return true;

            try
            {
                if (!handle_car_operation(choice))
                    return false;
            }
            catch (const runtime_error &e)
            {
                out_ << "Error: " << e.what() << endl;
            }
        }
    }

    // ========================================================================
    // CUSTOMER MENU
    // ========================================================================

    bool handle_customer_operation(const string &choice)
    {
        if (choice == "A")
        {
            Customer customer;
            if (!get_int_input("Customer ID: ", customer.customer_id) ||
                !get_text_input("Full name (max 30 characters): ", CUSTOMER_NAME_LEN, customer.name) ||
                !get_text_input("Phone (max 15 characters): ", CUSTOMER_PHONE_LEN, customer.phone))
                return false;

            uint64_t offset = customers_.add(customer);
            out_ << "Customer ID " << customer.customer_id << " saved at offset " << offset << "." << endl;
        }
        else if (choice == "U")
        {
            int32_t customer_id;
            string phone;
            if (!get_int_input("Customer ID to update: ", customer_id) ||
                !get_text_input("New phone: ", CUSTOMER_PHONE_LEN, phone))
                return false;

            if (customers_.update_phone(customer_id, phone))
                out_ << "Customer ID " << customer_id << " updated." << endl;
            else
                out_ << "Customer ID " << customer_id << " not found or deleted." << endl;
        }
        else if (choice == "D")
        {
            int32_t customer_id;
            if (!get_int_input("Customer ID to delete: ", customer_id))
                return false;

            if (customers_.remove(customer_id))
                out_ << "Customer ID " << customer_id << " deleted." << endl;
            else
                out_ << "Customer ID " << customer_id << " not found or already deleted." << endl;
        }
        else if (choice == "V")
        {
            auto customers = customers_.list_active();
            if (customers.empty())
                out_ << "No active customers." << endl;
            for (const auto &customer : customers)
                out_ << describe(customer) << endl;
        }
        else if (choice == "S")
        {
            int32_t customer_id;
            if (!get_int_input("Customer ID to search: ", customer_id))
                return false;

            auto found = customers_.find(customer_id);
            if (found)
                out_ << "Found: " << describe(found->record) << " (Offset: " << found->offset << " bytes)" << endl;
            else
                out_ << "Customer ID " << customer_id << " not found or deleted." << endl;
        }
        return true;
    }

    bool run_customer_menu()
    {
        while (true)
        {
            out_ << endl << "=== [2] Customers ===" << endl;
            out_ << "A: Add | U: Update phone | D: Delete" << endl;
            out_ << "V: View all | S: Search by ID" << endl;
            out_ << "X: Back to main menu" << endl;

            string choice;
            if (!get_user_choice(">> Choose: ", {"A", "U", "D", "V", "S", "X"}, choice))
                return false;
            if (choice == "X")
                return true;

            try
            {
                if (!handle_customer_operation(choice))
                    return false;
            }
            catch (const runtime_error &e)
            {
                out_ << "Error: " << e.what() << endl;
            }
        }
    }

    // ========================================================================
    // RENTAL MENU
    // ========================================================================

    bool handle_rental_operation(const string &choice)
    {
        if (choice == "A")
        {
            RentalRequest request;
            if (!get_int_input("Rental ID: ", request.rental_id) ||
                !get_int_input("Customer ID: ", request.customer_id) ||
                !get_int_input("Car ID: ", request.car_id))
                return false;

            // Fail before asking for dates when the references are bad.
            if (!customers_.get(request.customer_id))
            {
                out_ << "Customer ID " << request.customer_id << " is invalid or deleted." << endl;
                return true;
            }
            auto car = cars_.get(request.car_id);
            if (!car || car->is_rented)
            {
                out_ << "Car ID " << request.car_id << " is invalid, rented or deleted." << endl;
                return true;
            }

            if (!get_date_input("Start date (DDMMYYYY): ", request.start_date) ||
                !get_date_input("End date (DDMMYYYY): ", request.end_date))
                return false;

            Rental rental = rental_service_.create_rental(request);
            out_ << "Rental ID " << rental.rental_id << " created: "
                 << format_date_display(rental.start_date) << " to " << format_date_display(rental.end_date)
                 << ", total " << money(rental.total_price) << "." << endl;
        }
        else if (choice == "V")
        {
            auto rentals = rentals_.list_active();
            if (rentals.empty())
                out_ << "No active rentals." << endl;
            for (const auto &rental : rentals)
                out_ << describe(rental) << endl;
        }
        else if (choice == "D")
        {
            int32_t rental_id;
            if (!get_int_input("Rental ID to return: ", rental_id))
                return false;

            if (rental_service_.close_rental(rental_id))
                out_ << "Rental ID " << rental_id << " closed." << endl;
            else
                out_ << "Rental ID " << rental_id << " not found or already closed." << endl;
        }
        else if (choice == "S")
        {
            int32_t rental_id;
            if (!get_int_input("Rental ID to search: ", rental_id))
                return false;

            auto rental = rentals_.get(rental_id);
            if (rental)
                out_ << "Found: " << describe(*rental) << endl;
            else
                out_ << "Rental ID " << rental_id << " not found or closed." << endl;
        }
        else if (choice == "R")
        {
            reports_.generate_rental_summary_report(config_.report_path("rental_report.txt"));
        }
        else if (choice == "L")
        {
            reports_.generate_detailed_summary_report(config_.report_path("detailed_summary_report.txt"));
        }
        return true;
    }

    bool run_rental_menu()
    {
        while (true)
        {
            out_ << endl << "=== [3] Rentals ===" << endl;
            out_ << "A: Create | V: View all | S: Search by ID" << endl;
            out_ << "D: Return car | R: Rental summary report (.txt)" << endl;
            out_ << "L: Detailed rental report (.txt)" << endl;
            out_ << "X: Back to main menu" << endl;

            string choice;
            if (!get_user_choice(">> Choose: ", {"A", "V", "D", "S", "R", "L", "X"}, choice))
                return false;
            if (choice == "X")
                return true;

            try
            {
                if (!handle_rental_operation(choice))
                    return false;
            }
            catch (const runtime_error &e)
            {
                out_ << "Error: " << e.what() << endl;
            }
        }
    }

    // ========================================================================
    // MAIN MENU
    // ========================================================================

    bool run_main_menu()
    {
        while (true)
        {
            out_ << endl << string(50, '=') << endl;
            out_ << "        CAR RENTAL MANAGER (MAIN MENU)" << endl;
            out_ << string(50, '=') << endl;
            out_ << "[1] Cars" << endl;
            out_ << "[2] Customers" << endl;
            out_ << "[3] Rentals" << endl;
            out_ << "[M] Master report (.txt)" << endl;
            out_ << "[R] Detailed summary report (.txt)" << endl;
            out_ << "[J] JSON snapshot" << endl;
            out_ << "[X] Exit (close files)" << endl;

            string choice;
            if (!get_user_choice(">> Choose: ", {"1", "2", "3", "M", "R", "J", "X"}, choice))
                return false;

            bool more_input = true;
            if (choice == "1")
            {
                more_input = run_car_menu();
            }
            else if (choice == "2")
            {
                more_input = run_customer_menu();
            }
            else if (choice == "3")
            {
                more_input = run_rental_menu();
            }
            else if (choice == "X")
            {
                return true;
            }
            else
            {
                try
                {
                    if (choice == "M")
                        reports_.generate_master_report(config_.report_path("master_report.txt"));
                    else if (choice == "R")
                        reports_.generate_detailed_summary_report(config_.report_path("detailed_summary_report.txt"));
                    else
                        reports_.export_json_snapshot(config_.report_path("snapshot.json"));
                }
                catch (const runtime_error &e)
                {
                    out_ << "Error: " << e.what() << endl;
                }
            }

            if (!more_input)
                return false;
        }
    }

public:
    MenuHandler(CarManager &cars, CustomerManager &customers, RentalManager &rentals,
                RentalService &rental_service, ReportGenerator &reports,
                const CRMConfig &config, istream &in, ostream &out)
        : cars_(cars), customers_(customers), rentals_(rentals),
          rental_service_(rental_service), reports_(reports), config_(config),
          in_(in), out_(out) {}

    // Returns true when the user chose X, false when input ran out. Either
    // way the exit summary is written before returning.
    bool run()
    {
        bool chose_exit = run_main_menu();

        out_ << "Shutting down..." << endl;
        try
        {
            reports_.generate_detailed_summary_report(config_.report_path("final_exit_summary.txt"));
        }
        catch (const runtime_error &e)
        {
            out_ << "Error: " << e.what() << endl;
        }
        return chose_exit;
    }
};

#endif
