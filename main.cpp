#include <boost/program_options.hpp>
#include <glog/logging.h>
#include <iostream>
#include <kvwire/server.h>
#include <photon/common/utility.h>
#include <photon/photon.h>

namespace po = boost::program_options;

int main(int argc, char* argv[])
{
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    kvwire::ServerConfig config;
    po::options_description desc("kvwire-server options");
    desc.add_options()("help,h", "print this help")(
            "host", po::value<std::string>(&config.host_)->default_value(config.host_), "address to listen on")(
            "port,p", po::value<uint16_t>(&config.port_)->default_value(config.port_), "tcp port to listen on")(
            "max-clients,c",
            po::value<size_t>(&config.max_concurrent_connections_)->default_value(config.max_concurrent_connections_),
            "maximum number of connections served at once")(
            "workers,w", po::value<size_t>(&config.worker_thread_count_)->default_value(config.worker_thread_count_),
            "number of worker vcpus")(
            "read-chunk", po::value<size_t>(&config.network_read_chunk_)->default_value(config.network_read_chunk_),
            "bytes requested from the socket per read")(
            "max-bulk-len", po::value<int64_t>(&config.max_bulk_length_)->default_value(config.max_bulk_length_),
            "largest accepted bulk string, in bytes")(
            "max-aggregate-len",
            po::value<int64_t>(&config.max_aggregate_length_)->default_value(config.max_aggregate_length_),
            "most elements accepted in an array or a set, pairs in a map")(
            "max-line-len", po::value<size_t>(&config.max_line_length_)->default_value(config.max_line_length_),
            "longest accepted simple string, error or integer line, in bytes")(
            "log-level", po::value<std::string>(&config.log_level_)->default_value(config.log_level_),
            "one of debug, info, warn, error");

    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    }
    catch (const po::error& ex)
    {
        LOG(ERROR) << "invalid command line: " << ex.what();
        std::cerr << desc << "\n";
        return 1;
    }
    if (vm.count("help") > 0)
    {
        std::cout << desc << "\n";
        return 0;
    }
    if (const auto problem = config.validate(); problem.has_value())
    {
        LOG(ERROR) << "invalid configuration: " << problem.value();
        std::cerr << desc << "\n";
        return 1;
    }

    if (photon::init(config.event_engine_, photon::INIT_IO_NONE) != 0)
    {
        LOG(ERROR) << "photon::init failed";
        return 1;
    }
    DEFER(photon::fini());

    LOG(INFO) << "starting kvwire on " << config.host_ << ":" << config.port_ << " with "
              << config.worker_thread_count_ << " workers and at most " << config.max_concurrent_connections_
              << " concurrent connections";
    kvwire::Server server(config);
    if (server.run() != 0)
    {
        LOG(ERROR) << "server stopped on error";
        return 1;
    }
    return 0;
}
