#include <AbcPop/Codec.h>

#include <memory>
#include <sstream>

using std::string;
using std::vector;

namespace ABCPOP {

// non-exported helper: fetch a member, or fail as a transport problem
const Json::Value & require(const Json::Value & val, const char * key) {
    if (not val.isObject() or not val.isMember(key)) {
        throw TransportError(string("malformed message: missing '") + key + "'");
    }
    return val[key];
}

const Json::Value & require_array(const Json::Value & val, const char * key) {
    const Json::Value & arr = require(val, key);
    if (not arr.isArray()) { throw TransportError(string("malformed message: '") + key + "' is not an array"); }
    return arr;
}

float_type require_number(const Json::Value & val, const char * key) {
    const Json::Value & num = require(val, key);
    if (not num.isNumeric()) { throw TransportError(string("malformed message: '") + key + "' is not a number"); }
    return num.asDouble();
}

bool require_bool(const Json::Value & val, const char * key) {
    const Json::Value & b = require(val, key);
    if (not b.isBool()) { throw TransportError(string("malformed message: '") + key + "' is not a boolean"); }
    return b.asBool();
}

Json::UInt64 as_id(const Json::Value & val) {
    if (not val.isUInt64()) { throw TransportError("malformed message: expected an unsigned integer"); }
    return val.asUInt64();
}

Json::Value to_json(const vector<float_type> & vals) {
    Json::Value arr(Json::arrayValue);
    for (const float_type v : vals) { arr.append(v); }
    return arr;
}

vector<float_type> values_from_json(const Json::Value & val) {
    if (not val.isArray()) { throw TransportError("malformed message: expected an array of numbers"); }
    vector<float_type> vals;
    vals.reserve(val.size());
    for (const Json::Value & jv : val) {
        if (not jv.isNumeric()) { throw TransportError("malformed message: non-numeric value in array"); }
        vals.push_back(jv.asDouble());
    }
    return vals;
}

Json::Value to_json(const Particle & particle) {
    Json::Value val;
    val["parameter"] = to_json(particle.parameter);
    val["weight"] = particle.weight;
    val["distance"] = particle.distance;
    val["sum_stat"] = to_json(particle.sum_stat);
    val["accepted"] = particle.accepted;
    return val;
}

Particle particle_from_json(const Json::Value & val) {
    Particle particle;
    particle.parameter = values_from_json(require(val, "parameter"));
    particle.weight = require_number(val, "weight");
    particle.distance = require_number(val, "distance");
    particle.sum_stat = values_from_json(require(val, "sum_stat"));
    particle.accepted = require_bool(val, "accepted");
    return particle;
}

Json::Value to_json(const FullInfoParticle & particle) {
    Json::Value val;
    val["parameter"] = to_json(particle.parameter);
    val["weight"] = particle.weight;
    val["accepted"] = particle.accepted;
    Json::Value atts(Json::arrayValue);
    for (const Attempt & att : particle.attempts) {
        Json::Value jatt;
        jatt["sum_stat"] = to_json(att.sum_stat);
        jatt["distance"] = att.distance;
        jatt["accepted"] = att.accepted;
        atts.append(jatt);
    }
    val["attempts"] = atts;
    return val;
}

FullInfoParticle full_particle_from_json(const Json::Value & val) {
    FullInfoParticle particle;
    particle.parameter = values_from_json(require(val, "parameter"));
    particle.weight = require_number(val, "weight");
    particle.accepted = require_bool(val, "accepted");
    for (const Json::Value & jatt : require_array(val, "attempts")) {
        particle.attempts.push_back({
            values_from_json(require(jatt, "sum_stat")),
            require_number(jatt, "distance"),
            require_bool(jatt, "accepted")
        });
    }
    return particle;
}

Json::Value to_json(const Sample & sample) {
    Json::Value val;
    val["record_rejected"] = sample.record_rejected();
    Json::Value accepted(Json::arrayValue);
    for (const Particle & p : sample.accepted_particles()) { accepted.append(to_json(p)); }
    val["accepted"] = accepted;
    Json::Value stats(Json::arrayValue);
    for (const SumStat & ss : sample.all_sum_stats()) { stats.append(to_json(ss)); }
    val["all_sum_stats"] = stats;
    return val;
}

Sample sample_from_json(const Json::Value & val) {
    vector<Particle> accepted;
    for (const Json::Value & jp : require_array(val, "accepted")) { accepted.push_back(particle_from_json(jp)); }
    vector<SumStat> stats;
    for (const Json::Value & js : require_array(val, "all_sum_stats")) { stats.push_back(values_from_json(js)); }
    try {
        return Sample(require_bool(val, "record_rejected"), accepted, stats);
    } catch (const std::invalid_argument & e) {
        throw TransportError(string("malformed sample: ") + e.what());
    }
}

Json::Value to_json(const BatchTask & task) {
    Json::Value val;
    val["evaluator"] = task.evaluator;
    val["seed"] = static_cast<Json::UInt64>(task.seed);
    Json::Value pars(Json::arrayValue);
    for (const Theta & par : task.pars) { pars.append(to_json(par)); }
    val["pars"] = pars;
    Json::Value ids(Json::arrayValue);
    for (const size_t id : task.job_ids) { ids.append(static_cast<Json::UInt64>(id)); }
    val["job_ids"] = ids;
    return val;
}

BatchTask batch_task_from_json(const Json::Value & val) {
    BatchTask task;
    const Json::Value & name = require(val, "evaluator");
    if (not name.isString()) { throw TransportError("malformed message: 'evaluator' is not a string"); }
    task.evaluator = name.asString();
    task.seed = static_cast<unsigned long int>(as_id(require(val, "seed")));
    for (const Json::Value & jp : require_array(val, "pars")) { task.pars.push_back(values_from_json(jp)); }
    for (const Json::Value & jid : require_array(val, "job_ids")) {
        task.job_ids.push_back(static_cast<size_t>(as_id(jid)));
    }
    return task;
}

Json::Value to_json(const BatchResult & batch) {
    Json::Value arr(Json::arrayValue);
    for (const EvaluatedJob & job : batch) {
        Json::Value val;
        val["job_id"] = static_cast<Json::UInt64>(job.job_id);
        val["accepted"] = job.accepted;
        val["particle"] = to_json(job.particle);
        arr.append(val);
    }
    Json::Value val;
    val["batch"] = arr;
    return val;
}

BatchResult batch_result_from_json(const Json::Value & val) {
    BatchResult batch;
    for (const Json::Value & jv : require_array(val, "batch")) {
        batch.push_back({
            static_cast<size_t>(as_id(require(jv, "job_id"))),
            require_bool(jv, "accepted"),
            full_particle_from_json(require(jv, "particle"))
        });
    }
    return batch;
}

string encode(const Json::Value & val) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["useSpecialFloats"] = true;
    return Json::writeString(builder, val);
}

Json::Value decode(const string & msg) {
    Json::CharReaderBuilder builder;
    builder["allowSpecialFloats"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value val;
    string errs;
    if (not reader->parse(msg.data(), msg.data() + msg.size(), &val, &errs)) {
        throw TransportError("failed to parse message: " + errs);
    }
    return val;
}

string encode_error(const string & what) {
    Json::Value val;
    val["error"] = what;
    return encode(val);
}

bool is_error(const Json::Value & val, string * what) {
    if (val.isObject() and val.isMember("error")) {
        if (what != nullptr) { *what = val["error"].isString() ? val["error"].asString() : encode(val["error"]); }
        return true;
    }
    return false;
}

}
