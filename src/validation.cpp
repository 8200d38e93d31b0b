#include "validation.h"
#include "geo.h"

#include <unordered_set>

namespace vp
{

    static void flag(std::vector<DataIssue> &out, int id, const std::string &field,
                     const std::string &msg, const char *record = "patient")
    {
        out.push_back(DataIssue{id, field, msg, record});
    }

    std::vector<DataIssue> validate_records(const std::vector<Patient> &patients,
                                            const std::vector<Provider> &providers)
    {
        std::vector<DataIssue> out;

        // 1) Identity
        validate_patient_ids(patients, out);
        validate_provider_ids(providers, out);

        // 2) Per-record fields
        validate_visit_durations(patients, out);
        validate_intervals(patients, out);
        validate_coordinates(patients, out);
        validate_provider_budgets(providers, out);

        // 3) Patient -> provider links
        validate_provider_references(patients, providers, out);

        // NOTE: date fields are checked while resolving due dates, where the
        // decision that depends on them is made.
        return out;
    }

    void validate_patient_ids(const std::vector<Patient> &patients, std::vector<DataIssue> &out)
    {
        std::unordered_set<int> seen;
        seen.reserve(patients.size() * 2);
        for (const auto &p : patients)
        {
            if (!seen.insert(p.id).second)
                flag(out, p.id, "id", "duplicate patient id " + std::to_string(p.id));
        }
    }

    void validate_visit_durations(const std::vector<Patient> &patients, std::vector<DataIssue> &out)
    {
        for (const auto &p : patients)
        {
            if (p.visit_duration_minutes <= 0)
                flag(out, p.id, "visit_duration_minutes",
                     "non-positive visit duration " + std::to_string(p.visit_duration_minutes));
        }
    }

    void validate_intervals(const std::vector<Patient> &patients, std::vector<DataIssue> &out)
    {
        for (const auto &p : patients)
        {
            if (p.interval_days < 0)
                flag(out, p.id, "interval_days",
                     "negative interval " + std::to_string(p.interval_days));
            else if (p.is_one_time() && !p.planned_visit_date)
                flag(out, p.id, "planned_visit_date",
                     "one-time patient without planned date is never due");
        }
    }

    void validate_coordinates(const std::vector<Patient> &patients, std::vector<DataIssue> &out)
    {
        for (const auto &p : patients)
        {
            if (!p.coordinates)
            {
                flag(out, p.id, "coordinates", "missing coordinates (not geocoded)");
                continue;
            }
            if (!valid_coordinates(*p.coordinates))
                flag(out, p.id, "coordinates",
                     "coordinates out of range (" + std::to_string(p.coordinates->lat) + ", " +
                         std::to_string(p.coordinates->lon) + ")");
        }
    }

    void validate_provider_ids(const std::vector<Provider> &providers, std::vector<DataIssue> &out)
    {
        std::unordered_set<int> seen;
        for (const auto &b : providers)
        {
            if (!seen.insert(b.id).second)
                flag(out, b.id, "id", "duplicate provider id " + std::to_string(b.id), "provider");
        }
    }

    void validate_provider_budgets(const std::vector<Provider> &providers, std::vector<DataIssue> &out)
    {
        for (const auto &b : providers)
        {
            if (b.max_daily_minutes <= 0)
                flag(out, b.id, "max_daily_minutes",
                     "non-positive daily budget " + std::to_string(b.max_daily_minutes), "provider");
        }
    }

    void validate_provider_references(const std::vector<Patient> &patients,
                                      const std::vector<Provider> &providers,
                                      std::vector<DataIssue> &out)
    {
        std::unordered_set<int> ids;
        for (const auto &b : providers)
            ids.insert(b.id);

        for (const auto &p : patients)
        {
            if (p.primary_provider_id && !ids.count(*p.primary_provider_id))
                flag(out, p.id, "primary_provider_id",
                     "unknown provider " + std::to_string(*p.primary_provider_id));
            if (p.override_provider_id && !ids.count(*p.override_provider_id))
                flag(out, p.id, "override_provider_id",
                     "unknown provider " + std::to_string(*p.override_provider_id));
        }
    }

} // namespace vp
