#include <trellis/trellis.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

// Serves a single request for 'path' from the directory 'root' and prints the response:
//   trellis-serve-once <root> <path> [range]
// 'range' is sent as the 'range' header value, for instance "bytes=0-99".
int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <root> <path> [range]\n";
    return EXIT_FAILURE;
  }

  try {
    trellis::App app = trellis::Decorators({trellis::WithLog(), trellis::WithError()}, trellis::FileTree(argv[1]));

    trellis::HttpRequest request(trellis::http::GET, argv[2]);
    request.remote("127.0.0.1", 0).serverPort(80);
    if (argc > 3) {
      request.header(trellis::http::Range, argv[3]);
    }

    trellis::HttpResponse response = trellis::SyncWait(app(std::move(request)));
    const std::string content = trellis::SyncWait(response.body().readAll());

    std::cout << response.status() << ' ' << trellis::http::ReasonPhraseFor(response.status()) << '\n';
    for (const auto& [name, value] : response.headers()) {
      std::cout << name << ": " << value << '\n';
    }
    std::cout << '\n' << content;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return 0;
}
