#include "options.hpp"
#include "errors.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
namespace po = boost::program_options;

#include <limits>
#include <sstream>

int64_t parseByteSize(const std::string& text) {
    std::string t = boost::algorithm::trim_copy(text);
    std::string::size_type pos = 0;
    while (pos < t.size() && t[pos] >= '0' && t[pos] <= '9') {
        pos++;
    }
    if (pos == 0) {
        throw InvalidInput("Invalid size '" + text + "'");
    }
    std::string digits = t.substr(0, pos);
    std::string suffix = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(t.substr(pos)));

    int shift = 0;
    if (suffix.empty() || suffix == "b") {
        shift = 0;
    } else if (suffix == "k" || suffix == "kb" || suffix == "kib") {
        shift = 10;
    } else if (suffix == "m" || suffix == "mb" || suffix == "mib") {
        shift = 20;
    } else if (suffix == "g" || suffix == "gb" || suffix == "gib") {
        shift = 30;
    } else {
        throw InvalidInput("Invalid size suffix in '" + text + "'");
    }

    int64_t value = 0;
    try {
        value = boost::lexical_cast<int64_t>(digits);
    }
    catch (const boost::bad_lexical_cast&) {
        throw InvalidInput("Size out of range: '" + text + "'");
    }
    if (value > (std::numeric_limits<int64_t>::max() >> shift)) {
        throw InvalidInput("Size out of range: '" + text + "'");
    }
    value <<= shift;
    if (value <= 0) {
        throw InvalidInput("Size must be positive: '" + text + "'");
    }
    return value;
}

CliOptions parseCommandLine(int argc, const char* const argv[]) {
    CliOptions opts;
    std::string block_size;
    int jobs = 0;
    opts.help = false;
    opts.block_size = DEFAULT_BLOCK_SIZE;

    po::options_description desc("Usage: s3etag [options] <file>...\n"
                                 "       s3etag --verify <etag> <file>\nOptions");
    desc.add_options()
        ("help,h", "this message")
        ("block-size,b", po::value<std::string>(&block_size)->default_value("8MiB"),
            "multipart block size in bytes, K/M/G suffixes allowed (default: 8MiB)")
        ("jobs,j", po::value<int>(&jobs)->default_value(static_cast<int>(defaultWorkerCount())),
            "maximum number of hashing threads")
        ("sequential,s", po::bool_switch(&opts.etag.sequential), "read the file in order from a single thread")
        ("verify,V", po::value<std::string>(&opts.verify_tag), "check <file> against a reference ETag")
        ("log-level", po::value<boost::log::trivial::severity_level>(&opts.log_level)
            ->default_value(boost::log::trivial::warning), "trace, debug, info, warning, error or fatal")
        ("file", po::value<std::vector<std::string> >(&opts.files), "files to hash, '-' for standard input")
    ;
    po::positional_options_description po_desc;
    po_desc.add("file", -1);

    std::stringstream usage;
    usage << desc;
    opts.usage = usage.str();

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(po_desc).run(), vm);
        po::notify(vm);
    }
    catch (const po::error& ex) {
        throw InvalidInput(std::string("Invalid command line options: ") + ex.what());
    }

    if (vm.count("help")) {
        opts.help = true;
        return opts;
    }
    if (opts.files.empty()) {
        throw InvalidInput("There is no input file defined");
    }
    if (jobs < 1) {
        throw InvalidInput("--jobs must be at least 1, got " + std::to_string(jobs));
    }
    opts.etag.max_workers = static_cast<unsigned int>(jobs);
    if (vm.count("verify") && opts.files.size() != 1) {
        throw InvalidInput("--verify takes exactly one file");
    }
    if (vm.count("verify") && opts.verify_tag.empty()) {
        throw InvalidInput("--verify needs a non-empty ETag");
    }
    opts.block_size = parseByteSize(block_size);
    return opts;
}

void setLogLevel(boost::log::trivial::severity_level level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}
