#ifndef ABCPOP_CODEC_H
#define ABCPOP_CODEC_H

#include <string>
#include <json/json.h>

#include <AbcPop/Particle.h>
#include <AbcPop/Sample.h>
#include <AbcPop/Remote.h>

// JSON encoding of what crosses a process or rank boundary. Non-finite values
// (NaN distances, infinite statistics) are written as NaN / Infinity and read back.
// Every *_from_json throws TransportError on malformed input.

namespace ABCPOP {

    Json::Value to_json(const std::vector<float_type> & vals);
    std::vector<float_type> values_from_json(const Json::Value & val);

    Json::Value to_json(const Particle & particle);
    Particle particle_from_json(const Json::Value & val);

    Json::Value to_json(const FullInfoParticle & particle);
    FullInfoParticle full_particle_from_json(const Json::Value & val);

    Json::Value to_json(const Sample & sample);
    Sample sample_from_json(const Json::Value & val);

    Json::Value to_json(const BatchTask & task);
    BatchTask batch_task_from_json(const Json::Value & val);

    Json::Value to_json(const BatchResult & batch);
    BatchResult batch_result_from_json(const Json::Value & val);

    // compact, single line
    std::string encode(const Json::Value & val);
    Json::Value decode(const std::string & msg);

    // an error report in place of a result: {"error": what}
    std::string encode_error(const std::string & what);
    // the error text, if `val` is an error report
    bool is_error(const Json::Value & val, std::string * what);

}

#endif // ABCPOP_CODEC_H
