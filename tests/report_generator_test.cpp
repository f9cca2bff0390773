#include <gtest/gtest.h>

#include "../source/reports/ReportGenerator.h"
#include "test_helpers.h"

class ReportGeneratorTest : public ::testing::Test {
protected:
    TempDir dir;
    CarManager cars;
    CustomerManager customers;
    RentalManager rentals;
    RentalService service;
    ReportGenerator reports;

    ReportGeneratorTest()
        : cars(dir.file("cars.bin"), false),
          customers(dir.file("customers.bin"), false),
          rentals(dir.file("rentals.bin"), false),
          service(cars, customers, rentals, false),
          reports(cars, customers, rentals) {}

    void SetUp() override {
        cars.add(Car(1, "Toyota Camry", "ABC123", 1200.0));
        cars.add(Car(2, "Toyota Yaris", "DEF456", 800.0));
        cars.add(Car(3, "Honda Civic", "XYZ789", 1000.0));
        customers.add(Customer(1, "Somchai", "0811111111"));
        customers.add(Customer(2, "Malee", "0822222222"));
    }

    void rent(int32_t id, int32_t customer_id, int32_t car_id) {
        RentalRequest req;
        req.rental_id = id;
        req.customer_id = customer_id;
        req.car_id = car_id;
        req.start_date = 1012025;
        req.end_date = 3012025;
        service.create_rental(req);
    }

    static bool contains(const std::string &text, const std::string &needle) {
        return text.find(needle) != std::string::npos;
    }
};

TEST_F(ReportGeneratorTest, FleetSummaryCounts) {
    cars.remove(3);
    rent(1, 1, 1);

    FleetSummary summary = reports.compute_fleet_summary();
    EXPECT_EQ(summary.total_car_slots, 3u);
    EXPECT_EQ(summary.active_cars, 2u);
    EXPECT_EQ(summary.deleted_cars, 1u);
    EXPECT_EQ(summary.currently_rented, 1u);
    EXPECT_EQ(summary.available_now, 1u);
    EXPECT_DOUBLE_EQ(summary.min_rate, 800.0);
    EXPECT_DOUBLE_EQ(summary.max_rate, 1200.0);
    EXPECT_DOUBLE_EQ(summary.avg_rate, 1000.0);
}

TEST_F(ReportGeneratorTest, EmptyFleetHasZeroRates) {
    TempDir other;
    CarManager no_cars(other.file("cars.bin"), false);
    CustomerManager no_customers(other.file("customers.bin"), false);
    RentalManager no_rentals(other.file("rentals.bin"), false);
    ReportGenerator empty(no_cars, no_customers, no_rentals);

    FleetSummary summary = empty.compute_fleet_summary();
    EXPECT_EQ(summary.active_cars, 0u);
    EXPECT_DOUBLE_EQ(summary.avg_rate, 0.0);
    EXPECT_TRUE(contains(empty.build_master_report(), "No active cars found."));
}

TEST_F(ReportGeneratorTest, BrandsGroupedByFirstWord) {
    auto brands = reports.count_active_cars_by_brand();
    ASSERT_EQ(brands.size(), 2u);
    EXPECT_EQ(brands.begin()->first, "Honda");
    EXPECT_EQ(brands["Honda"], 1u);
    EXPECT_EQ(brands["Toyota"], 2u);
    EXPECT_EQ(ReportGenerator::brand_of("Mazda"), "Mazda");
}

TEST_F(ReportGeneratorTest, MoneyFormatting) {
    EXPECT_EQ(ReportGenerator::format_money(1234567.5), "1,234,567.50");
    EXPECT_EQ(ReportGenerator::format_money(0.0), "0.00");
    EXPECT_EQ(ReportGenerator::format_money(999.999), "1,000.00");
    EXPECT_EQ(ReportGenerator::format_money(-1500.0), "-1,500.00");
    EXPECT_EQ(ReportGenerator::format_money(100.0), "100.00");
}

TEST_F(ReportGeneratorTest, MasterReportListsActiveRecords) {
    cars.remove(2);
    rent(1, 1, 1);

    std::string report = reports.build_master_report();
    EXPECT_TRUE(contains(report, "MASTER RENTAL SYSTEM REPORT"));
    EXPECT_TRUE(contains(report, "Total Active Cars: 2"));
    EXPECT_TRUE(contains(report, "Total Active Customers: 2"));
    EXPECT_TRUE(contains(report, "Total Active Rentals: 1"));
    EXPECT_TRUE(contains(report, "Toyota Camry"));
    EXPECT_FALSE(contains(report, "Toyota Yaris"));
    EXPECT_TRUE(contains(report, "01-01-2025"));
    EXPECT_TRUE(contains(report, "3600.00"));
}

TEST_F(ReportGeneratorTest, DetailedReportShowsDanglingReferences) {
    rent(1, 1, 1);
    rent(2, 2, 3);
    customers.remove(1);
    cars.remove(3);

    std::string report = reports.build_detailed_summary_report();
    EXPECT_TRUE(contains(report, "N/A (Deleted)"));
    EXPECT_TRUE(contains(report, "N/A (Invalid)"));
    EXPECT_TRUE(contains(report, "Inactive"));
    EXPECT_TRUE(contains(report, "Malee"));
    EXPECT_TRUE(contains(report, "- Deleted Cars         : 1"));
    EXPECT_TRUE(contains(report, "- Toyota : 2"));
}

TEST_F(ReportGeneratorTest, RentalSummaryTotalsRevenue) {
    rent(1, 1, 1);
    rent(2, 2, 2);

    std::string report = reports.build_rental_summary_report();
    EXPECT_TRUE(contains(report, "Total Active Rentals: 2"));
    EXPECT_TRUE(contains(report, "Total Revenue (active): 6,000.00"));
}

TEST_F(ReportGeneratorTest, SnapshotCarriesActiveRecords) {
    rent(1, 1, 1);
    cars.remove(3);

    nlohmann::json snapshot = reports.build_snapshot();
    ASSERT_EQ(snapshot["cars"].size(), 2u);
    EXPECT_EQ(snapshot["cars"][0]["model"], "Toyota Camry");
    EXPECT_EQ(snapshot["cars"][0]["is_rented"], true);
    EXPECT_EQ(snapshot["customers"].size(), 2u);
    ASSERT_EQ(snapshot["rentals"].size(), 1u);
    EXPECT_DOUBLE_EQ(snapshot["rentals"][0]["total_price"].get<double>(), 3600.0);
    EXPECT_EQ(snapshot["rentals"][0]["end_date"], 3012025);
    EXPECT_TRUE(snapshot.contains("generated_at"));
}

TEST_F(ReportGeneratorTest, WritesFilesCreatingDirectories) {
    std::string master = dir.file("reports/master_report.txt");
    std::string json_path = dir.file("reports/snapshot.json");

    EXPECT_TRUE(reports.generate_master_report(master));
    EXPECT_TRUE(reports.export_json_snapshot(json_path));
    EXPECT_TRUE(contains(read_text_file(master), "Total Active Cars: 3"));

    nlohmann::json parsed = nlohmann::json::parse(read_text_file(json_path));
    EXPECT_EQ(parsed["cars"].size(), 3u);
}

TEST_F(ReportGeneratorTest, UnwritablePathReturnsFalse) {
    write_text_file(dir.file("blocker"), "x");
    EXPECT_FALSE(reports.generate_detailed_summary_report(dir.file("blocker/report.txt")));
}

TEST_F(ReportGeneratorTest, RentedCountFollowsStoredFlag) {
    rent(1, 1, 1);
    cars.set_rented(1, false);
    cars.set_rented(2, true);

    FleetSummary summary = reports.compute_fleet_summary();
    EXPECT_EQ(summary.currently_rented, 1u);
    EXPECT_EQ(summary.available_now, 2u);
    EXPECT_EQ(summary.available_now, cars.get_available_cars().size());
}
