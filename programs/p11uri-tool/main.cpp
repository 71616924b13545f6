#include <p11uri/Module.hpp>
#include <p11uri/URI.hpp>
#include <p11uri/check.hpp>
#include <p11uri/config.hpp>
#include <p11uri/errors.hpp>
#include <p11uri/log.hpp>
#include <p11uri/resolve.hpp>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <boost/program_options/variables_map.hpp>

#include <iomanip>
#include <iostream>
#include <sstream>

using namespace p11uri;

namespace po = boost::program_options;

const char usage[] = R"(USAGE: p11uri-tool [options] parse <uri>...
       p11uri-tool [options] locate <uri>
       p11uri-tool [options] list

Commands:
  parse     Validate URIs and print their attributes
  locate    Find the object identified by a URI
  list      Print the tokens of the module given by --module)";

std::string hex(const std::vector<unsigned char>& bytes)
{
   std::ostringstream ss;
   ss << std::hex << std::setfill('0');
   for (auto b : bytes)
      ss << std::setw(2) << static_cast<unsigned>(b);
   return ss.str();
}

template <typename T>
void print(std::string_view name, const std::optional<T>& value)
{
   if (value)
      std::cout << name << ": " << *value << "\n";
}

void printAttributes(const URI& uri)
{
   const auto& p = uri.path();
   print("library-description", p.libraryDescription);
   print("library-manufacturer", p.libraryManufacturer);
   print("library-version", p.libraryVersion);
   print("slot-description", p.slotDescription);
   print("slot-id", p.slotId);
   print("slot-manufacturer", p.slotManufacturer);
   print("manufacturer", p.manufacturer);
   print("model", p.model);
   print("token", p.token);
   if (p.serial)
      std::cout << "serial: "
                << pkcs11::getString(reinterpret_cast<const char*>(p.serial->data()),
                                     p.serial->size())
                << "\n";
   print("type", p.type);
   if (p.id)
      std::cout << "id: " << hex(*p.id) << "\n";
   print("object", p.object);

   const auto& q = uri.query();
   print("pin-source", q.pinSource);
   if (q.pinValue)
      std::cout << "pin-value: <hidden>\n";
   print("module-name", q.moduleName);
   print("module-path", q.modulePath);
}

int parseCommand(const std::vector<std::string>& args)
{
   check(!args.empty(), "parse requires at least one URI");
   int result = 0;
   for (const auto& arg : args)
   {
      try
      {
         URI uri(arg);
         if (args.size() > 1)
            std::cout << arg << "\n";
         printAttributes(uri);
      }
      catch (ParseError& e)
      {
         P11URI_LOG(loggers::generic::get(), error) << arg << ": " << e.what();
         result = 1;
      }
   }
   return result;
}

int locateCommand(const std::vector<std::string>& args, const ResolverConfig& config)
{
   check(args.size() == 1, "locate requires exactly one URI");
   URI   uri(args.front());
   auto  found   = resolve(uri, config);
   auto& session = found.session;
   std::cout << "slot: " << found.slot << "\n";
   std::cout << "object: " << static_cast<unsigned long>(found.object) << "\n";
   print("type", found.module->objectClass(session.handle(), found.object));
   print("label", found.module->objectLabel(session.handle(), found.object));
   return 0;
}

int listCommand(const std::vector<std::string>& args, const ResolverConfig& config)
{
   check(args.empty(), "list does not take arguments");
   check(!config.defaultModule.empty(), "list requires --module");
   PKCS11Module module(config.defaultModule);
   auto         info = module.libraryInfo();
   std::cout << "library: " << info.manufacturer << " " << info.description << " " << info.version
             << "\n";
   for (auto slot : module.listSlots(true))
   {
      std::cout << "slot " << slot << ": " << makeURI(module.tokenInfo(slot)) << "\n";
   }
   return 0;
}

int main(int argc, char* argv[])
{
   ResolverConfig           config;
   std::string              command;
   std::vector<std::string> args;
   std::string              configFile;

   po::options_description common_opts = resolverOptions(config);
   po::options_description desc("p11uri-tool");
   desc.add(common_opts);
   auto opt = desc.add_options();
   opt("config,c", po::value(&configFile)->value_name("path"), "Read options from a config file");
   opt("help,h", "Show this message");

   po::options_description hidden;
   hidden.add_options()("command", po::value(&command))("args", po::value(&args));
   po::options_description all;
   all.add(desc).add(hidden);
   po::positional_options_description positional;
   positional.add("command", 1).add("args", -1);

   po::variables_map vm;
   try
   {
      po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(),
                vm);
      if (auto pos = vm.find("config"); pos != vm.end())
      {
         loadConfigFile(pos->second.as<std::string>(), common_opts, vm);
      }
      po::notify(vm);
   }
   catch (std::exception& e)
   {
      if (!vm.count("help"))
      {
         std::cerr << e.what() << "\n";
         return 1;
      }
   }

   if (vm.count("help") || command.empty())
   {
      std::cerr << usage << "\n\n";
      std::cerr << desc << "\n";
      return 1;
   }

   try
   {
      loggers::configure(vm);
      validate(config);
      if (command == "parse")
         return parseCommand(args);
      else if (command == "locate")
         return locateCommand(args, config);
      else if (command == "list")
         return listCommand(args, config);
      else
         abortMessage("Unknown command: " + command);
   }
   catch (std::exception& e)
   {
      P11URI_LOG(loggers::generic::get(), error) << e.what();
      return 1;
   }
}
