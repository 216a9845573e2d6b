#ifndef KESTREL_KESTREL_H
#define KESTREL_KESTREL_H

#include "configuration/config.h"
#include "nn/model.h"
#include "pipeline/trainer.h"

/** Resolves the configured device. GPU falls back to CPU when CUDA is unavailable. */
torch::Device resolveDevice(torch::DeviceType device_type);

shared_ptr<TrainingLoop> initTrainingLoop(shared_ptr<KestrelConfig> config, shared_ptr<KGEModel> model, torch::Device device);

void writeLosses(const std::vector<double> &losses, string path);

/**
  Loads the training triples, trains a model as configured, then optionally saves it and evaluates it on the test triples.
  @return The trained model and its per-epoch losses
*/
std::tuple<shared_ptr<KGEModel>, std::vector<double>> kestrel_train(shared_ptr<KestrelConfig> config);

/**
  Command line entry point: kestrel_train <config.ini> [--section.option=value ...]
  @return Process exit status
*/
int kestrel(int argc, const char *argv[]);

#endif  // KESTREL_KESTREL_H
