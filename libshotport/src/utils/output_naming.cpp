//
// Created by the shotport authors on 10/11/25.
//

#include "../../include/output_naming.hpp"
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace shotport {

    namespace {

        std::string to_lower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

    } // namespace

    fs::path output_filename(const fs::path& source) {
        const fs::path name = source.filename();
        if (to_lower(name.extension().string()) == ".png") {
            return name;
        }
        return fs::path(name.stem().string() + ".png");
    }

    fs::path sibling_output_path(const fs::path& source) {
        return source.parent_path() / (source.stem().string() + "_ios.png");
    }

    OutputNameAllocator::OutputNameAllocator(fs::path output_dir) : dir_(std::move(output_dir)) {}

    bool OutputNameAllocator::claim(const std::string& name) {
        return taken_.insert(to_lower(name)).second;
    }

    fs::path OutputNameAllocator::allocate(const fs::path& source) {
        const fs::path base = output_filename(source);
        if (claim(base.string())) {
            return dir_ / base;
        }
        const std::string stem = base.stem().string();
        const std::string ext = base.extension().string();
        for (unsigned n = 1;; ++n) {
            std::string candidate = stem + "_" + std::to_string(n) + ext;
            if (claim(candidate)) {
                return dir_ / candidate;
            }
        }
    }

    std::vector<ConversionJob> plan_jobs(const std::vector<fs::path>& sources, const fs::path& output_dir) {
        OutputNameAllocator names(output_dir);
        std::vector<ConversionJob> jobs;
        jobs.reserve(sources.size());
        for (const auto& src : sources) {
            jobs.push_back({src, names.allocate(src)});
        }
        return jobs;
    }

} // namespace shotport
