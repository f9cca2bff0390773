#include "../../include/crm_config.hpp"
#include "../../include/crm_errors.hpp"
#include "../core/CarManager.h"
#include "../core/CustomerManager.h"
#include "../core/RentalManager.h"
#include "../core/RentalService.h"
#include "../reports/ReportGenerator.h"
#include "MenuHandler.h"
#include <exception>
#include <iostream>
#include <string>

using namespace std;

int main(int argc, char **argv)
{
    cout << "========================================" << endl;
    cout << "  Car Rental Manager" << endl;
    cout << "  Fixed-record binary storage" << endl;
    cout << "========================================" << endl;

    string config_path = (argc > 1) ? argv[1] : "config/crm_config.json";

    CRMConfig config;
    try
    {
        config = load_config(config_path);
    }
    catch (const exception &e)
    {
        cerr << "ERROR: " << e.what() << endl;
        return 1;
    }

    cout << "  Data directory: " << config.data_dir << endl;
    cout << "  Reports:        " << config.report_dir << endl;
    cout << endl;

    try
    {
        // Stores release their files on scope exit even if the menu throws.
        CarManager cars(config.car_path(), config.verbose);
        CustomerManager customers(config.customer_path(), config.verbose);
        RentalManager rentals(config.rental_path(), config.verbose);

        RentalService rental_service(cars, customers, rentals, config.verbose);
        ReportGenerator reports(cars, customers, rentals);
        MenuHandler menu(cars, customers, rentals, rental_service, reports, config, cin, cout);

        menu.run();

        cout << "Syncing car data..." << endl;
        cars.close();
        cout << "Syncing customer data..." << endl;
        customers.close();
        cout << "Syncing rental data..." << endl;
        rentals.close();
        cout << "All files closed." << endl;
    }
    catch (const exception &e)
    {
        cerr << endl << "FATAL: " << e.what() << endl;
        return 1;
    }

    return 0;
}
