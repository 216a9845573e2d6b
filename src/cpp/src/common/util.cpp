#include "common/util.h"

#include <sys/stat.h>

#include "reporting/logger.h"

void assert_in_range(torch::Tensor values, int64_t start, int64_t end, const std::string &name) {
    if (!values.defined()) {
        throw UndefinedTensorException();
    }

    if (values.numel() == 0) {
        return;
    }

    if ((values.lt(start) | values.ge(end)).any().item<bool>()) {
        int64_t min_val = values.min().item<int64_t>();
        int64_t max_val = values.max().item<int64_t>();
        throw IndexOutOfRangeException(fmt::format("{} out of range [{}, {}): observed min {} max {}", name, start, end, min_val, max_val));
    }
}

std::string get_directory(std::string filename) {
    const size_t last_slash_idx = filename.rfind('/');
    if (std::string::npos != last_slash_idx) {
        return filename.substr(0, last_slash_idx);
    }
    return "";
}

bool fileExists(std::string file_path) {
    struct stat buffer;
    return (stat(file_path.c_str(), &buffer) == 0);
}

void createDir(std::string path) {
    if (path.empty() || fileExists(path)) {
        return;
    }

    std::string parent = get_directory(path.back() == '/' ? path.substr(0, path.size() - 1) : path);
    if (!parent.empty()) {
        createDir(parent);
    }

    if (mkdir(path.c_str(), 0777) != 0 && !fileExists(path)) {
        throw KestrelRuntimeException("Unable to create directory: " + path);
    }
}
