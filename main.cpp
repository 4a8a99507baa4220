#include <boost/log/trivial.hpp>

#include <iostream>
using namespace std;

#include "errors.hpp"
#include "etag.hpp"
#include "options.hpp"

enum ExitCode {
    EXIT_OK = 0,
    EXIT_MISMATCH = 1,
    EXIT_USAGE = 2,
    EXIT_INVALID = 3,
    EXIT_IO = 4,
    EXIT_RANGE = 5,
    EXIT_WORKER = 6,
    EXIT_INTERNAL = 7
};

int main(int argc, const char* argv[]) {
    CliOptions opts;
    try {
        opts = parseCommandLine(argc, argv);
    }
    catch (const InvalidInput& ex) {
        cerr << ex.what() << endl << endl << "Try 's3etag --help'" << endl;
        return EXIT_USAGE;
    }

    if (opts.help) {
        cout << opts.usage << "\n";
        return EXIT_OK;
    }

    setLogLevel(opts.log_level);

    try {
        EtagHasher hs(opts.etag);
        if (!opts.verify_tag.empty()) {
            bool match = hs.verifyTag(opts.files.front(), opts.verify_tag);
            cout << (match ? "OK" : "MISMATCH") << endl;
            BOOST_LOG_TRIVIAL(info) << opts.files.front() << ": " << (match ? "matches " : "does not match ")
                                    << opts.verify_tag;
            return match ? EXIT_OK : EXIT_MISMATCH;
        }
        for (const string& file : opts.files) {
            string tag = hs.computeTag(file, opts.block_size);
            cout << tag << "  " << file << endl;
            BOOST_LOG_TRIVIAL(info) << "ETag: " << tag << " for " << file;
        }
    }
    catch (const InvalidInput& ex) {
        BOOST_LOG_TRIVIAL(error) << "Aborting. " << ex.what();
        cerr << "Aborting. " << ex.what() << endl;
        return EXIT_INVALID;
    }
    catch (const IOError& ex) {
        BOOST_LOG_TRIVIAL(error) << "Aborting. " << ex.what();
        cerr << "Aborting. " << ex.what() << endl;
        return EXIT_IO;
    }
    catch (const RangeError& ex) {
        BOOST_LOG_TRIVIAL(error) << "Aborting. " << ex.what();
        cerr << "Aborting. " << ex.what() << endl;
        return EXIT_RANGE;
    }
    catch (const WorkerError& ex) {
        BOOST_LOG_TRIVIAL(error) << "Aborting. " << ex.what();
        cerr << "Aborting. " << ex.what() << endl;
        return EXIT_WORKER;
    }
    catch (const std::exception& ex) {
        BOOST_LOG_TRIVIAL(error) << "Aborting. " << ex.what();
        cerr << "Aborting. " << ex.what() << endl;
        return EXIT_INTERNAL;
    }

    return EXIT_OK;
}
