#ifndef CRM_CONFIG_HPP
#define CRM_CONFIG_HPP

#include "crm_types.hpp"
#include "crm_errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>
#include <iostream>
#include <string>
using namespace std;

struct CRMConfig
{
    string data_dir;
    string car_file;
    string customer_file;
    string rental_file;
    string report_dir;
    bool verbose;

    CRMConfig() : data_dir("data"), car_file(CAR_FILE_NAME),
                  customer_file(CUSTOMER_FILE_NAME), rental_file(RENTAL_FILE_NAME),
                  report_dir("reports"), verbose(true) {}

    string car_path() const { return join(data_dir, car_file); }
    string customer_path() const { return join(data_dir, customer_file); }
    string rental_path() const { return join(data_dir, rental_file); }
    string report_path(const string &name) const { return join(report_dir, name); }

private:
    static string join(const string &dir, const string &name)
    {
        if (dir.empty())
            return name;
        if (dir.back() == '/')
            return dir + name;
        return dir + "/" + name;
    }
};

namespace crm_config_detail
{
    inline void read_string(const nlohmann::json &doc, const char *key, string &target)
    {
        auto it = doc.find(key);
        if (it == doc.end())
            return;
        if (!it->is_string())
            throw ValidationError(string("Config key '") + key + "' must be a string");
        target = it->get<string>();
    }
}

// Keys that are absent keep their defaults.
inline CRMConfig parse_config(const string &text)
{
    using json = nlohmann::json;

    json doc;
    try
    {
        doc = json::parse(text);
    }
    catch (const json::parse_error &e)
    {
        throw ValidationError(string("Malformed config: ") + e.what());
    }

    if (!doc.is_object())
    {
        throw ValidationError("Config root must be a JSON object");
    }

    CRMConfig config;
    crm_config_detail::read_string(doc, "data_dir", config.data_dir);
    crm_config_detail::read_string(doc, "car_file", config.car_file);
    crm_config_detail::read_string(doc, "customer_file", config.customer_file);
    crm_config_detail::read_string(doc, "rental_file", config.rental_file);
    crm_config_detail::read_string(doc, "report_dir", config.report_dir);

    auto verbose = doc.find("verbose");
    if (verbose != doc.end())
    {
        if (!verbose->is_boolean())
            throw ValidationError("Config key 'verbose' must be a boolean");
        config.verbose = verbose->get<bool>();
    }

    if (config.car_file.empty() || config.customer_file.empty() || config.rental_file.empty())
    {
        throw ValidationError("Config file names must not be empty");
    }

    return config;
}

// A missing file is not an error: the defaults apply.
inline CRMConfig load_config(const string &path)
{
    ifstream in(path);
    if (!in.is_open())
    {
        cout << "Config '" << path << "' not found, using defaults." << endl;
        return CRMConfig();
    }

    string text((istreambuf_iterator<char>(in)), istreambuf_iterator<char>());
    return parse_config(text);
}

#endif
