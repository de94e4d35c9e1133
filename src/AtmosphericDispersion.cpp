/**
 * @file AtmosphericDispersion.cpp
 * @brief Implementation of stability classification and dispersion widths
 *
 * See AtmosphericDispersion.hpp for detailed documentation.
 */

#include "AtmosphericDispersion.hpp"
#include "HazardErrors.hpp"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace HAZCON {

using namespace HazardConstants;

// =============================================================================
// Stability class names
// =============================================================================

std::string stabilityClassName(StabilityClass cls) {
    switch (cls) {
        case StabilityClass::A:   return "A";
        case StabilityClass::A_B: return "A~B";
        case StabilityClass::B:   return "B";
        case StabilityClass::B_C: return "B~C";
        case StabilityClass::C:   return "C";
        case StabilityClass::C_D: return "C~D";
        case StabilityClass::D:   return "D";
        case StabilityClass::D_E: return "D~E";
        case StabilityClass::E:   return "E";
        case StabilityClass::E_F: return "E~F";
        case StabilityClass::F:   return "F";
    }
    return "?";
}

StabilityClass parseStabilityClass(const std::string& name) {
    static const std::map<std::string, StabilityClass> lookup = {
        {"A", StabilityClass::A},     {"A~B", StabilityClass::A_B},
        {"B", StabilityClass::B},     {"B~C", StabilityClass::B_C},
        {"C", StabilityClass::C},     {"C~D", StabilityClass::C_D},
        {"D", StabilityClass::D},     {"D~E", StabilityClass::D_E},
        {"E", StabilityClass::E},     {"E~F", StabilityClass::E_F},
        {"F", StabilityClass::F}
    };
    auto it = lookup.find(name);
    if (it == lookup.end()) {
        throw ValidationError("Unknown stability class: " + name);
    }
    return it->second;
}

// =============================================================================
// DispersionTables
// =============================================================================

namespace {

DispersionTables buildTables() {
    using S = StabilityClass;
    DispersionTables t{
        {{-2, -1, 1, 2, 3},
         {-1,  0, 1, 2, 3},
         {-1,  0, 0, 1, 1},
         { 0,  0, 0, 0, 1},
         { 0,  0, 0, 0, 0}},
        {{S::A,   S::A_B, S::B, S::D, S::E, S::F},
         {S::A_B, S::B,   S::C, S::D, S::E, S::F},
         {S::B,   S::B_C, S::C, S::D, S::D, S::E},
         {S::C,   S::C_D, S::D, S::D, S::D, S::D},
         {S::D,   S::D,   S::D, S::D, S::D, S::D}},
        {}
    };

    t.coefficients[S::A] = {
        {0.0,      0.0,      1.12154, 0.079990},
        {0.901074, 0.425809, 1.51360, 0.008548},
        {0.850934, 0.602052, 2.10881, 0.000212}
    };
    t.coefficients[S::A_B] = {
        {0.907722, 0.353828, 1.19986, 0.071909},
        {0.857974, 0.499203, 1.60119, 0.028618}
    };
    t.coefficients[S::B] = {
        {0.914370, 0.281846, 0.96444, 0.127190},
        {0.865014, 0.396353, 1.09356, 0.057025}
    };
    t.coefficients[S::B_C] = {
        {0.919325, 0.229500, 0.94102, 0.114682},
        {0.875086, 0.314238, 1.00770, 0.075718}
    };
    t.coefficients[S::C] = {
        {0.924279, 0.177154, 0.0,     0.0},
        {0.885157, 0.232123, 0.91760, 0.106803}
    };
    t.coefficients[S::C_D] = {
        {0.0,      0.0,      0.83863, 0.126152},
        {0.926849, 0.143940, 0.75641, 0.235667},
        {0.886940, 0.189396, 0.81558, 0.136659}
    };
    t.coefficients[S::D] = {
        {0.0,      0.0,      0.82621, 0.104634},
        {0.929418, 0.110726, 0.63202, 0.400167},
        {0.888723, 0.146669, 0.55536, 0.810763}
    };
    t.coefficients[S::D_E] = {
        {0.0,      0.0,      0.77686, 0.111771},
        {0.925118, 0.098563, 0.57235, 0.528992},
        {0.892794, 0.124308, 0.49915, 1.037100}
    };
    t.coefficients[S::E] = {
        {0.0,      0.0,      0.78837, 0.092753},
        {0.920818, 0.086400, 0.56518, 0.433384},
        {0.896864, 0.101947, 0.41474, 1.732410}
    };
    t.coefficients[S::E_F] = {
        {0.0,      0.0,      0.78639, 0.077415},
        {0.925118, 0.070882, 0.54558, 0.401700},
        {0.892794, 0.087641, 0.36870, 2.069660}
    };
    t.coefficients[S::F] = {
        {0.0,      0.0,      0.78440, 0.062077},
        {0.929418, 0.055363, 0.52597, 0.370015},
        {0.888723, 0.073335, 0.32266, 2.406910}
    };
    return t;
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int days[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) return 29;
    return days[month - 1];
}

} // anonymous namespace

const DispersionTables& DispersionTables::instance() {
    static const DispersionTables tables = buildTables();
    return tables;
}

// =============================================================================
// SiteTime
// =============================================================================

SiteTime SiteTime::parse(const std::string& text) {
    std::tm tm = {};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) {
        throw ValidationError(parameterError("start_datetime"));
    }

    SiteTime t;
    t.year = tm.tm_year + 1900;
    t.month = tm.tm_mon + 1;
    t.day = tm.tm_mday;
    t.hour = tm.tm_hour;
    t.minute = tm.tm_min;
    t.second = tm.tm_sec;

    if (t.month < 1 || t.month > 12 || t.day < 1 || t.day > daysInMonth(t.year, t.month) ||
        t.hour < 0 || t.hour > 23 || t.minute < 0 || t.minute > 59 ||
        t.second < 0 || t.second > 60) {
        throw ValidationError(parameterError("start_datetime"));
    }
    return t;
}

SiteTime SiteTime::now() {
    std::time_t raw = std::time(nullptr);
    std::tm tm = {};
    localtime_r(&raw, &tm);

    SiteTime t;
    t.year = tm.tm_year + 1900;
    t.month = tm.tm_mon + 1;
    t.day = tm.tm_mday;
    t.hour = tm.tm_hour;
    t.minute = tm.tm_min;
    t.second = tm.tm_sec;
    return t;
}

int SiteTime::dayOfYear() const {
    int doy = day;
    for (int m = 1; m < month; ++m) {
        doy += daysInMonth(year, m);
    }
    return doy;
}

std::string SiteTime::toString() const {
    std::ostringstream ss;
    ss << std::setfill('0')
       << std::setw(4) << year << "-" << std::setw(2) << month << "-" << std::setw(2) << day
       << " " << std::setw(2) << hour << ":" << std::setw(2) << minute << ":"
       << std::setw(2) << second;
    return ss.str();
}

// =============================================================================
// GasDiffusionModel Implementation
// =============================================================================

GasDiffusionModel::GasDiffusionModel(const std::string& material,
                                     const ParameterList& material_params,
                                     const ParameterList& environment_params,
                                     const std::string& start_datetime)
    : HazardModel(material, material_params, environment_params) {
    if (start_datetime.empty()) {
        std::string now = SiteTime::now().toString();
        std::cerr << "Warning: start_datetime not given, using current time " << now << std::endl;
        setTextValue("start_datetime", now);
    } else {
        setTextValue("start_datetime", start_datetime);
    }
}

std::string GasDiffusionModel::getStartDatetime() const {
    return textValue("start_datetime").value_or("");
}

SiteTime GasDiffusionModel::siteTime() const {
    return SiteTime::parse(getStartDatetime());
}

double GasDiffusionModel::windSpeed() const {
    auto wind = environmentValue("wind_speed");
    if (!wind || !(*wind > 0.0)) {
        throw ValidationError(parameterError("wind_speed"));
    }
    return *wind;
}

double GasDiffusionModel::calcDeclination() {
    if (auto hit = cached("declination")) return *hit;

    int day = siteTime().dayOfYear();
    if (day == 366) day = 365;
    double theta = 2.0 * PI * day / 365.0;

    double declination = (0.006918
                          - 0.399912 * std::cos(theta) + 0.070257 * std::sin(theta)
                          - 0.006758 * std::cos(2.0 * theta) + 0.000907 * std::sin(2.0 * theta)
                          - 0.002697 * std::cos(3.0 * theta) + 0.00148 * std::sin(3.0 * theta))
                         * RAD_TO_DEG;

    recordResult("declination", declination);
    return storeDerived("declination", declination);
}

double GasDiffusionModel::calcSolarAngle() {
    if (auto hit = cached("solar_angle")) return *hit;

    auto lon = environmentValue("center_longitude");
    auto lat = environmentValue("center_latitude");
    if (!lat || *lat < 0.0) {
        throw ValidationError(parameterError("center_latitude"));
    }
    if (!lon || *lon < 0.0) {
        throw ValidationError(parameterError("center_longitude"));
    }

    int hour = siteTime().hour;
    double phi = (*lat) * DEG_TO_RAD;
    double delta = calcDeclination() * DEG_TO_RAD;
    double hour_angle = (15.0 * hour + (*lon) - 300.0) * DEG_TO_RAD;

    double s = std::sin(phi) * std::sin(delta) +
               std::cos(phi) * std::cos(delta) * std::cos(hour_angle);
    s = std::max(-1.0, std::min(1.0, s));
    double solar_angle = std::asin(s) * RAD_TO_DEG;

    recordResult("solar_angle", solar_angle);
    return storeDerived("solar_angle", solar_angle);
}

int GasDiffusionModel::solarRadiationLevel() {
    if (auto hit = cached("solar_radiation_level")) return static_cast<int>(*hit);

    auto total = environmentValue("total_cloudiness");
    auto low = environmentValue("low_cloudiness");
    if (!total || *total < 0.0) {
        throw ValidationError(parameterError("total_cloudiness"));
    }
    if (!low || *low < 0.0) {
        throw ValidationError(parameterError("low_cloudiness"));
    }
    const double tc = *total;
    const double lc = *low;
    if (tc < lc) {
        throw ValidationError(parameterError("total_cloudiness, low_cloudiness"));
    }

    // Cloud cover bands [0,5), [5,8), [8,inf)
    int row = 0;
    if (tc < 5.0) row = 0;
    else if (lc >= 8.0) row = 4;
    else if (lc >= 5.0) row = 3;
    else if (tc >= 8.0) row = 2;
    else row = 1;

    int col = 0;
    int hour = siteTime().hour;
    if (hour >= 7 && hour < 19) {
        double angle = calcSolarAngle();
        if (angle < 15.0) col = 1;
        else if (angle < 35.0) col = 2;
        else if (angle < 65.0) col = 3;
        else col = 4;
    }

    int level = DispersionTables::instance().radiation_level[row][col];
    recordResult("solar_radiation_level", level);
    storeDerived("solar_radiation_level", level);
    return level;
}

StabilityClass GasDiffusionModel::atmosphericStability() {
    if (auto hit = cached("atmospheric_stability")) {
        return static_cast<StabilityClass>(static_cast<int>(*hit));
    }

    double wind = windSpeed();
    int level = solarRadiationLevel();

    int row = 4;
    if (wind < 1.9) row = 0;
    else if (wind < 2.9) row = 1;
    else if (wind < 4.9) row = 2;
    else if (wind < 5.9) row = 3;

    int col = 3 - level;
    if (col < 0 || col > 5) {
        throw ValidationError("Unknown solar radiation level: " + std::to_string(level));
    }

    StabilityClass cls = DispersionTables::instance().stability[row][col];
    recordTextResult("atmospheric_stability", stabilityClassName(cls));
    storeDerived("atmospheric_stability", static_cast<int>(cls));
    return cls;
}

double GasDiffusionModel::resolveDistance(const std::optional<GeoPoint>& point,
                                          std::optional<double> downwind_distance) const {
    if (downwind_distance) {
        if (*downwind_distance < 0.0) {
            throw ValidationError(parameterError("hdis"));
        }
        return *downwind_distance;
    }
    if (!point) {
        throw ValidationError(parameterError("pgis, hdis"));
    }
    GeoPoint center(requireEnvironment("center_longitude"),
                    requireEnvironment("center_latitude"));
    return geographicalDistance(center, *point);
}

DiffusionCoefficients GasDiffusionModel::coefficientsAt(double distance, bool keep) {
    using S = StabilityClass;
    StabilityClass cls = atmosphericStability();
    const double x = distance;

    int h = 0, v = 0;
    switch (cls) {
        case S::A:
            if (x <= 300.0)       { h = 1; v = 0; }
            else if (x <= 500.0)  { h = 1; v = 1; }
            else if (x <= 1000.0) { h = 1; v = 2; }
            else                  { h = 2; v = 2; }
            break;
        case S::A_B:
        case S::B:
        case S::B_C:
            if (x <= 500.0)       { h = 0; v = 0; }
            else if (x <= 1000.0) { h = 0; v = 1; }
            else                  { h = 1; v = 1; }
            break;
        case S::C:
            if (x <= 1000.0)      { h = 0; v = 1; }
            else                  { h = 1; v = 1; }
            break;
        case S::D:
        case S::E:
        case S::E_F:
        case S::F:
            if (x <= 1000.0)       { h = 1; v = 0; }
            else if (x <= 10000.0) { h = 2; v = 1; }
            else                   { h = 2; v = 2; }
            break;
        default:
            // C~D and D~E
            if (x <= 1000.0)      { h = 1; v = 0; }
            else if (x <= 2000.0) { h = 2; v = 1; }
            else                  { h = 2; v = 2; }
            break;
    }

    const auto& rows = DispersionTables::instance().coefficients.at(cls);
    DiffusionCoefficients result;
    result.row.alpha1 = rows.at(h).alpha1;
    result.row.gamma1 = rows.at(h).gamma1;
    result.row.alpha2 = rows.at(v).alpha2;
    result.row.gamma2 = rows.at(v).gamma2;
    result.horizontal_row = h;
    result.vertical_row = v;
    result.distance = x;

    if (keep) {
        recordResult("alpha1", result.row.alpha1);
        recordResult("gamma1", result.row.gamma1);
        recordResult("alpha2", result.row.alpha2);
        recordResult("gamma2", result.row.gamma2);
    }
    return result;
}

DiffusionCoefficients GasDiffusionModel::diffusionParamCoefficients(
    const std::optional<GeoPoint>& point, std::optional<double> downwind_distance) {
    return coefficientsAt(resolveDistance(point, downwind_distance), true);
}

DiffusionWidths GasDiffusionModel::widthsAt(double distance, double sampling_minutes, bool keep) {
    if (!(sampling_minutes >= 30.0 && sampling_minutes < 6000.0)) {
        throw ValidationError(parameterError("freq"));
    }

    DiffusionCoefficients c = coefficientsAt(distance, keep);
    const double x = c.distance;
    const double hours = sampling_minutes / 60.0;

    DiffusionWidths w;
    w.sigma_y = c.row.gamma1 * std::pow(x, c.row.alpha1);
    w.sigma_z = c.row.gamma2 * std::pow(x, c.row.alpha2);

    double q = (hours >= 0.5 && hours < 1.0) ? 0.2 : 0.3;
    w.sigma_y *= std::pow(hours / 0.5, q);

    if (keep) {
        recordResult("sigma_y(m)", w.sigma_y);
        recordResult("sigma_z(m)", w.sigma_z);
    }
    return w;
}

DiffusionWidths GasDiffusionModel::diffusionParameters(const std::optional<GeoPoint>& point,
                                                       std::optional<double> downwind_distance,
                                                       double sampling_minutes) {
    if (!(sampling_minutes >= 30.0 && sampling_minutes < 6000.0)) {
        throw ValidationError(parameterError("freq"));
    }
    return widthsAt(resolveDistance(point, downwind_distance), sampling_minutes, true);
}

std::vector<ParameterSpec> GasDiffusionModel::necessaryMaterialParams() {
    return unite(HazardModel::necessaryMaterialParams(), {});
}

std::vector<ParameterSpec> GasDiffusionModel::necessaryEnvironmentParams() {
    return unite(HazardModel::necessaryEnvironmentParams(), {
        {"center_longitude", "deg", "Longitude of the accident site"},
        {"center_latitude", "deg", "Latitude of the accident site"},
        {"total_cloudiness", "tenths", "Total cloud cover"},
        {"low_cloudiness", "tenths", "Low cloud cover"},
        {"wind_speed", "m/s", "Mean wind speed"},
        {"start_datetime", "yyyy-mm-dd hh:mm:ss", "Accident start time", true}
    });
}

} // namespace HAZCON
