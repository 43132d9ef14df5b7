/*  Copyright 2012 MaidSafe.net limited

    This MaidSafe Software is licensed to you under (1) the MaidSafe.net Commercial License,
    version 1.0 or later, or (2) The General Public License (GPL), version 3, depending on which
    licence you accepted on initial access to the Software (the "Licences").

    By contributing code to the MaidSafe Software, or to this project generally, you agree to be
    bound by the terms of the MaidSafe Contributor Agreement, version 1.0, found in the root
    directory of this project at LICENSE, COPYING and CONTRIBUTOR respectively and also
    available at: http://www.maidsafe.net/licenses

    Unless required by applicable law or agreed to in writing, the MaidSafe Software distributed
    under the GPL Licence is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS
    OF ANY KIND, either express or implied.

    See the Licences for the specific language governing permissions and limitations relating to
    use of the MaidSafe Software.                                                                 */

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "boost/asio/io_service.hpp"
#include "boost/optional/optional.hpp"
#include "boost/program_options.hpp"
#include "boost/system/system_error.hpp"
#include "glog/logging.h"

#include "natcheck/nat_classifier.h"
#include "natcheck/nat_type.h"
#include "natcheck/parameters.h"
#include "natcheck/socks5_transport.h"
#include "natcheck/udp_transport.h"
#include "natcheck/utils.h"

namespace asio = boost::asio;
namespace ip = boost::asio::ip;
namespace bs = boost::system;
namespace po = boost::program_options;

namespace {

const char kFirstServer[] = "nncs1-lp1.n.n.srv.nintendo.net";
const char kSecondServer[] = "nncs2-lp1.n.n.srv.nintendo.net";

// Function used to check that if 'for_what' is specified, then
// 'required_option' is specified too.
void OptionDependency(const po::variables_map& variables_map, const char* for_what,
                      const char* required_option) {
  if (variables_map.count(for_what) && !variables_map[for_what].defaulted()) {
    if (variables_map.count(required_option) == 0 || variables_map[required_option].defaulted()) {
      throw std::logic_error(std::string("Option '") + for_what + "' requires option '" +
                             required_option + "'.");
    }
  }
}

void ThrowIfError(const bs::error_code& ec, const std::string& what) {
  if (ec)
    throw bs::system_error(ec, what);
}

std::unique_ptr<natcheck::Transport> BindTransport(
    asio::io_service& io_service, const boost::optional<ip::tcp::endpoint>& proxy,
    const boost::optional<natcheck::Socks5Credentials>& credentials,
    const boost::optional<natcheck::Timeout>& timeout) {
  const natcheck::Transport::Endpoint any(ip::address_v4::any(), 0);
  bs::error_code ec;
  std::unique_ptr<natcheck::Transport> transport;
  if (proxy) {
    std::unique_ptr<natcheck::Socks5Transport> socks5(new natcheck::Socks5Transport(io_service));
    socks5->Bind(*proxy, any, credentials, ec);
    ThrowIfError(ec, "Failed to associate with SOCKS5 proxy");
    transport = std::move(socks5);
  } else {
    std::unique_ptr<natcheck::UdpTransport> udp(new natcheck::UdpTransport(io_service));
    udp->Bind(any, ec);
    ThrowIfError(ec, "Failed to bind UDP socket");
    transport = std::move(udp);
  }

  transport->set_read_timeout(timeout, ec);
  ThrowIfError(ec, "Failed to set read timeout");
  natcheck::Transport::Endpoint local(transport->local_endpoint(ec));
  if (ec)
    LOG(WARNING) << "Failed to read local endpoint: " << ec.message();
  else
    LOG(INFO) << "Transport bound at " << local;
  return transport;
}

}  // unnamed namespace

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;
  try {
    const std::string default_timeout(
        std::to_string(natcheck::Parameters::default_receive_timeout.total_milliseconds()));
    po::options_description options_description("Options");
    options_description.add_options()
        ("help,h", "Print options.")
        ("socks-proxy,s", po::value<std::string>(),
            "SOCKS5 proxy to relay probes through, as host:port.")
        ("username", po::value<std::string>(), "Username for the SOCKS5 proxy.")
        ("password", po::value<std::string>(), "Password for the SOCKS5 proxy.")
        ("timeout,w", po::value<std::string>()->default_value(default_timeout),
            "Milliseconds to wait for each response, 0 to wait forever.")
        ("verbose,v", po::bool_switch(), "Verbose logging to console.");

    po::variables_map variables_map;
    po::store(po::parse_command_line(argc, argv, options_description), variables_map);
    po::notify(variables_map);

    if (variables_map.count("help")) {
      std::cout << options_description << std::endl;
      return 0;
    }

    OptionDependency(variables_map, "username", "password");
    OptionDependency(variables_map, "password", "username");
    OptionDependency(variables_map, "username", "socks-proxy");

    FLAGS_minloglevel = variables_map["verbose"].as<bool>() ? google::INFO : google::WARNING;

    bs::error_code ec;
    boost::optional<natcheck::Timeout> timeout(
        natcheck::ParseTimeout(variables_map["timeout"].as<std::string>(), ec));
    ThrowIfError(ec, "Invalid --timeout");

    asio::io_service io_service;
    ip::address_v4 first_server(natcheck::ResolveIpv4(io_service, kFirstServer, ec));
    ThrowIfError(ec, std::string("Failed to resolve ") + kFirstServer);
    ip::address_v4 second_server(natcheck::ResolveIpv4(io_service, kSecondServer, ec));
    ThrowIfError(ec, std::string("Failed to resolve ") + kSecondServer);
    LOG(INFO) << "Rendezvous servers " << first_server << " and " << second_server;

    boost::optional<ip::tcp::endpoint> proxy;
    if (variables_map.count("socks-proxy")) {
      proxy = natcheck::ResolveProxyEndpoint(
          io_service, variables_map["socks-proxy"].as<std::string>(), ec);
      ThrowIfError(ec, "Invalid SOCKS5 proxy");
    }

    boost::optional<natcheck::Socks5Credentials> credentials;
    if (variables_map.count("username")) {
      credentials = natcheck::Socks5Credentials(variables_map["username"].as<std::string>(),
                                                variables_map["password"].as<std::string>());
    }

    std::unique_ptr<natcheck::Transport> first(
        BindTransport(io_service, proxy, credentials, timeout));
    std::unique_ptr<natcheck::Transport> second(
        BindTransport(io_service, proxy, credentials, timeout));

    natcheck::NatClassification classification(
        natcheck::ClassifyNat(*first, *second, first_server, second_server));

    if (classification.external_address)
      std::cout << "Remote Address: " << *classification.external_address << '\n';
    std::cout << "NAT Type:\n"
              << "  Nintendo Switch : " << natcheck::NintendoLabel(classification.nat_type) << '\n'
              << "  Sony PlayStation: " << natcheck::SonyLabel(classification.nat_type) << '\n'
              << "  Microsoft Xbox  : " << natcheck::MicrosoftLabel(classification.nat_type)
              << std::endl;
  }
  catch(const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
