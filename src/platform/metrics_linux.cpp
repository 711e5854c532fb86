#include "vitalmon/metrics_provider.hpp"
#include "vitalmon/log.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <sys/statvfs.h>

namespace vitalmon {

namespace {

struct CpuTimes {
    unsigned long long total = 0;
    unsigned long long idle = 0;
};

// Parse one "cpuN user nice system idle iowait irq softirq steal" line
CpuTimes parse_cpu_line(const std::string& line) {
    std::istringstream iss(line);
    std::string cpu;
    unsigned long long user = 0, nice = 0, system = 0, idle = 0;
    unsigned long long iowait = 0, irq = 0, softirq = 0, steal = 0;
    iss >> cpu >> user >> nice >> system >> idle >> iowait >> irq >> softirq >> steal;

    CpuTimes times;
    times.total = user + nice + system + idle + iowait + irq + softirq + steal;
    times.idle = idle + iowait;
    return times;
}

std::ifstream open_or_throw(const char* path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ProviderUnavailable(std::string("cannot open ") + path + ": " + std::strerror(errno));
    }
    return file;
}

} // namespace

class LinuxMetricsProvider : public MetricsProvider {
public:
    std::vector<double> sample_cpu_per_core() override {
        auto stat_file = open_or_throw("/proc/stat");
        std::string line;
        std::getline(stat_file, line); // Skip first line (aggregate)

        std::vector<double> usage;
        std::vector<CpuTimes> current;
        while (std::getline(stat_file, line)) {
            if (line.compare(0, 3, "cpu") != 0) break;

            CpuTimes times = parse_cpu_line(line);
            size_t index = current.size();
            current.push_back(times);

            // Delta against the previous call; since boot on the first one
            CpuTimes prev;
            if (index < prev_cores_.size()) {
                prev = prev_cores_[index];
            }
            unsigned long long total_diff = times.total >= prev.total ? times.total - prev.total : 0;
            unsigned long long idle_diff = times.idle >= prev.idle ? times.idle - prev.idle : 0;

            double value = 0.0;
            if (total_diff > 0 && idle_diff <= total_diff) {
                value = 100.0 * (1.0 - static_cast<double>(idle_diff) / total_diff);
            }
            usage.push_back(value);
        }

        if (current.empty()) {
            throw ProviderUnavailable("no per-core lines in /proc/stat");
        }
        prev_cores_ = std::move(current);
        return usage;
    }

    MemoryReading sample_memory() override {
        auto meminfo = open_or_throw("/proc/meminfo");
        MemoryReading reading;
        bool have_total = false;
        bool have_available = false;
        std::string line;

        while (std::getline(meminfo, line)) {
            std::istringstream iss(line);
            std::string key;
            uint64_t value = 0;
            iss >> key >> value;

            // Convert kB to bytes
            value *= 1024;

            if (key == "MemTotal:") {
                reading.total_bytes = value;
                have_total = true;
            } else if (key == "MemAvailable:") {
                reading.available_bytes = value;
                have_available = true;
            } else if (key == "MemFree:") {
                reading.free_bytes = value;
            }
        }

        if (!have_total || !have_available || reading.total_bytes == 0) {
            throw ProviderUnavailable("/proc/meminfo lacks MemTotal or MemAvailable");
        }

        reading.used_bytes = reading.total_bytes > reading.available_bytes
            ? reading.total_bytes - reading.available_bytes : 0;
        reading.percent = static_cast<double>(reading.used_bytes) / reading.total_bytes * 100.0;
        return reading;
    }

    std::vector<DiskReading> sample_disks() override {
        auto mounts = open_or_throw("/proc/mounts");
        std::vector<DiskReading> disks;
        std::set<std::string> seen;
        size_t attempted = 0;
        std::string line;

        while (std::getline(mounts, line)) {
            std::istringstream iss(line);
            std::string device, mount_path, fstype;
            iss >> device >> mount_path >> fstype;

            // Physical devices only; pseudo filesystems have no /dev/ source
            if (device.compare(0, 5, "/dev/") != 0) continue;
            if (!seen.insert(mount_path).second) continue;
            ++attempted;

            struct statvfs stat;
            if (statvfs(mount_path.c_str(), &stat) != 0) {
                Log::debug("statvfs(", mount_path, ") failed: ", std::strerror(errno));
                continue;
            }

            DiskReading disk;
            disk.device = device;
            disk.mount_path = mount_path;
            disk.fstype = fstype;
            disk.total_bytes = static_cast<uint64_t>(stat.f_blocks) * stat.f_frsize;
            disk.used_bytes = static_cast<uint64_t>(stat.f_blocks - stat.f_bfree) * stat.f_frsize;
            disk.free_bytes = static_cast<uint64_t>(stat.f_bavail) * stat.f_frsize;

            // Percent of the space available to unprivileged users
            uint64_t usable = disk.used_bytes + disk.free_bytes;
            if (usable > 0) {
                disk.percent = static_cast<double>(disk.used_bytes) / usable * 100.0;
            }
            disks.push_back(disk);
        }

        if (attempted > 0 && disks.empty()) {
            throw ProviderUnavailable("no mounted volume could be stat'ed");
        }
        return disks;
    }

    NetworkCounters sample_network_counters() override {
        auto net_file = open_or_throw("/proc/net/dev");
        NetworkCounters counters;
        std::string line;

        // Skip header lines
        std::getline(net_file, line);
        std::getline(net_file, line);

        while (std::getline(net_file, line)) {
            // Format: "  eth0: rx_bytes rx_packets errs drop fifo frame compressed multicast tx_bytes tx_packets ..."
            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;

            std::string if_name = line.substr(0, colon);
            size_t start = if_name.find_first_not_of(" \t");
            if (start != std::string::npos) {
                if_name = if_name.substr(start);
            }

            // Skip loopback
            if (if_name == "lo") continue;

            std::istringstream iss(line.substr(colon + 1));
            uint64_t fields[10] = {};
            for (auto& field : fields) {
                iss >> field;
            }
            if (!iss) {
                Log::debug("malformed /proc/net/dev line for ", if_name);
                continue;
            }

            counters.bytes_recv += fields[0];
            counters.packets_recv += fields[1];
            counters.bytes_sent += fields[8];
            counters.packets_sent += fields[9];
        }

        return counters;
    }

    TimePoint boot_time() override {
        auto stat_file = open_or_throw("/proc/stat");
        std::string line;
        while (std::getline(stat_file, line)) {
            if (line.compare(0, 6, "btime ") == 0) {
                long long seconds = std::stoll(line.substr(6));
                return TimePoint(std::chrono::seconds(seconds));
            }
        }
        throw ProviderUnavailable("no btime line in /proc/stat");
    }

private:
    std::vector<CpuTimes> prev_cores_;
};

std::unique_ptr<MetricsProvider> create_linux_metrics_provider() {
    return std::make_unique<LinuxMetricsProvider>();
}

} // namespace vitalmon
