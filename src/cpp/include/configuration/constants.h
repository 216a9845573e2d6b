#ifndef KESTREL_CONSTANTS_H
#define KESTREL_CONSTANTS_H

#include <string>

#include "common/datatypes.h"

namespace PathConstants {
const string model_file = "model.pt";
const string losses_file = "losses.csv";
const string entity_mapping_file = "entity_to_id.tsv";
const string relation_mapping_file = "relation_to_id.tsv";
const string logs_directory = "logs/";
};  // namespace PathConstants

#endif  // KESTREL_CONSTANTS_H
