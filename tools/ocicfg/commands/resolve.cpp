/**
 * ocicfg CLI - resolve command
 *
 * Runs reference resolution only and prints the descriptor path.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <ocicfg/cas_engine.hpp>
#include <ocicfg/resolver.hpp>

namespace ocicfg::cli::commands
{

    namespace
    {

        struct ResolveOptions
        {
            std::string image;
        };

        int cmd_resolve(const GlobalOptions &opts, const ResolveOptions &resolve_opts)
        {
            auto parsed_ref = parse_image_ref(resolve_opts.image);
            if (parsed_ref.isErr())
            {
                print_error(parsed_ref.error(), opts.json);
                return 1;
            }
            const ImageRef &ref = parsed_ref.value();

            auto engine = open_dir_engine(ref.layout);
            if (engine.isErr())
            {
                print_error(engine.error().withContext("open CAS"), opts.json);
                return 1;
            }

            auto resolved = resolve_manifest(*engine.value(), ref.tag);
            if (resolved.isErr())
            {
                print_error(resolved.error().withContext("resolve " + ref.tag), opts.json);
                return 1;
            }

            const auto &walk = resolved.value().path.walk;
            if (opts.json)
            {
                nlohmann::ordered_json arr = nlohmann::ordered_json::array();
                for (const auto &d : walk)
                {
                    arr.push_back(descriptor_to_json(d));
                }
                std::cout << arr.dump(2) << std::endl;
            }
            else
            {
                for (const auto &d : walk)
                {
                    std::cout << d.media_type << " " << d.digest << " " << d.size << std::endl;
                }
            }
            return 0;
        }

    } // anonymous namespace

    void setup_resolve(CLI::App *app, GlobalOptions &opts)
    {
        static ResolveOptions resolve_opts;

        app->add_option("--image", resolve_opts.image, "OCI layout and tag (<path>[:<tag>], tag defaults to latest)")
            ->required();

        app->callback([&opts]()
                      { std::exit(cmd_resolve(opts, resolve_opts)); });
    }

} // namespace ocicfg::cli::commands
