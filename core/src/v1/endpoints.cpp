#include "poppk/v1/endpoints.hpp"

#include <Eigen/Core>

#include <algorithm>
#include <cmath>

namespace poppk::v1 {

Real cmax(std::span<const Observation> observations) {
    Real peak = 0.0;
    for (const auto& obs : observations) {
        peak = std::max(peak, obs.concentration);
    }
    return peak;
}

Real auc(std::span<const Observation> observations) {
    Real area = 0.0;
    for (std::size_t i = 1; i < observations.size(); ++i) {
        const Real dt = observations[i].time - observations[i - 1].time;
        area += 0.5 * dt * (observations[i].concentration + observations[i - 1].concentration);
    }
    return area;
}

Real tmax(std::span<const Observation> observations) {
    const Real peak = cmax(observations);
    for (const auto& obs : observations) {
        if (obs.concentration >= peak) {
            return obs.time;
        }
    }
    return observations.empty() ? 0.0 : observations.front().time;
}

IndividualEndpoints compute_endpoints(const PatientResult& patient) {
    IndividualEndpoints out;
    out.patient_id = patient.patient_id;
    out.weight = patient.demographics.weight;
    out.age = patient.demographics.age;
    out.cmax = cmax(patient.observations);
    out.auc = auc(patient.observations);
    out.tmax = tmax(patient.observations);
    return out;
}

SummaryStatistic summarize(std::span<const Real> values) {
    SummaryStatistic stat;
    stat.count = values.size();
    if (values.empty()) {
        return stat;
    }

    const Eigen::Map<const Eigen::VectorXd> x(values.data(),
                                              static_cast<Eigen::Index>(values.size()));
    stat.mean = x.mean();
    if (values.size() >= 2) {
        const Real ss = (x.array() - stat.mean).square().sum();
        stat.sd = std::sqrt(ss / static_cast<Real>(values.size() - 1));
    }
    return stat;
}

PopulationSummary summarize_population(std::span<const PatientResult> patients) {
    std::vector<Real> cl_values;
    std::vector<Real> v_values;
    std::vector<Real> cmax_values;
    std::vector<Real> auc_values;
    std::vector<Real> tmax_values;

    for (const auto& patient : patients) {
        if (auto cl = find_parameter(patient.parameters, "CL")) {
            cl_values.push_back(*cl);
        }
        auto v = find_parameter(patient.parameters, "V");
        if (!v) {
            v = find_parameter(patient.parameters, "V1");
        }
        if (v) {
            v_values.push_back(*v);
        }

        const auto endpoints = compute_endpoints(patient);
        cmax_values.push_back(endpoints.cmax);
        auc_values.push_back(endpoints.auc);
        tmax_values.push_back(endpoints.tmax);
    }

    PopulationSummary summary;
    summary.n_patients = patients.size();
    summary.cl = summarize(cl_values);
    summary.v = summarize(v_values);
    summary.cmax = summarize(cmax_values);
    summary.auc = summarize(auc_values);
    summary.tmax = summarize(tmax_values);
    return summary;
}

}  // namespace poppk::v1
