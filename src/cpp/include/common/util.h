#ifndef KESTREL_UTIL_H
#define KESTREL_UTIL_H

#include "datatypes.h"

class Timer {
   public:
    std::chrono::time_point<std::chrono::high_resolution_clock> start_time_;
    std::chrono::time_point<std::chrono::high_resolution_clock> stop_time_;

    Timer() {}

    void start() { start_time_ = std::chrono::high_resolution_clock::now(); }

    void stop() { stop_time_ = std::chrono::high_resolution_clock::now(); }

    int64_t getDuration(bool ms = true) {
        if (ms) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(stop_time_ - start_time_).count();
        }
        return std::chrono::duration_cast<std::chrono::microseconds>(stop_time_ - start_time_).count();
    }
};

/** Throws IndexOutOfRangeException if any value lies outside [start, end) */
void assert_in_range(torch::Tensor values, int64_t start, int64_t end, const std::string &name = "Index");

std::string get_directory(std::string path);

bool fileExists(std::string file_path);

void createDir(std::string path);

#endif  // KESTREL_UTIL_H
