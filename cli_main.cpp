#include <boost/program_options.hpp>
#include <glog/logging.h>
#include <iostream>
#include <kvwire/client.h>
#include <kvwire/errors.h>
#include <photon/common/utility.h>
#include <photon/photon.h>
#include <system_error>

namespace po = boost::program_options;

int main(int argc, char* argv[])
{
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    std::string host{"127.0.0.1"};
    uint16_t port = 31337;
    std::vector<std::string> command;

    po::options_description desc("usage: kvwire-cli [options] COMMAND [ARGS...]");
    desc.add_options()("help,h", "print this help")("host", po::value<std::string>(&host)->default_value(host),
                                                     "server address")(
            "port,p", po::value<uint16_t>(&port)->default_value(port), "server port")(
            "command", po::value<std::vector<std::string>>(&command), "command and its arguments");
    po::positional_options_description positional;
    positional.add("command", -1);

    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
        po::notify(vm);
    }
    catch (const po::error& ex)
    {
        LOG(ERROR) << "invalid command line: " << ex.what();
        std::cerr << desc << "\n";
        return 1;
    }
    if (vm.count("help") > 0 || command.empty())
    {
        std::cout << desc << "\n";
        return command.empty() && vm.count("help") == 0 ? 1 : 0;
    }

    if (photon::init(photon::INIT_EVENT_DEFAULT, photon::INIT_IO_NONE) != 0)
    {
        LOG(ERROR) << "photon::init failed";
        return 1;
    }
    DEFER(photon::fini());

    try
    {
        const auto client = kvwire::Client::connect(host, port);
        kvwire::render_reply(std::cout, client->execute(command));
    }
    catch (const kvwire::CommandError& ex)
    {
        std::cout << "(error) " << ex.what() << "\n";
        return 1;
    }
    catch (const std::system_error& ex)
    {
        LOG(ERROR) << ex.what();
        return 1;
    }
    return 0;
}
