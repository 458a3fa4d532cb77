/**
 * ocicfg CLI - runtime-config command
 *
 * Resolves an image reference and writes the runtime configuration for it.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <ocicfg/cas_engine.hpp>
#include <ocicfg/idmap.hpp>
#include <ocicfg/meta.hpp>
#include <ocicfg/resolver.hpp>
#include <ocicfg/synthesizer.hpp>

#include <optional>
#include <unistd.h>

namespace ocicfg::cli::commands
{

    namespace
    {

        struct RuntimeConfigOptions
        {
            std::string image;
            std::string rootfs;
            std::vector<std::string> uid_maps;
            std::vector<std::string> gid_maps;
            bool rootless = false;
            std::string config_path;
        };

        int cmd_runtime_config(const GlobalOptions &opts, const RuntimeConfigOptions &rc_opts)
        {
            auto parsed_ref = parse_image_ref(rc_opts.image);
            if (parsed_ref.isErr())
            {
                print_error(parsed_ref.error(), opts.json);
                return 1;
            }
            const ImageRef &ref = parsed_ref.value();

            IdmapDirectives directives;
            directives.uid_maps = rc_opts.uid_maps;
            directives.gid_maps = rc_opts.gid_maps;
            directives.rootless = rc_opts.rootless;
            directives.euid = static_cast<uint32_t>(geteuid());
            directives.egid = static_cast<uint32_t>(getegid());

            // Mapping directives are checked before the store is touched
            auto map_options = parse_idmap_options(directives);
            if (map_options.isErr())
            {
                print_error(map_options.error().withContext("parse mapping options"), opts.json);
                return 1;
            }

            auto engine = open_dir_engine(ref.layout);
            if (engine.isErr())
            {
                print_error(engine.error().withContext("open CAS"), opts.json);
                return 1;
            }
            CasEngine &cas = *engine.value();

            auto resolved = resolve_manifest(cas, ref.tag);
            if (resolved.isErr())
            {
                print_error(resolved.error().withContext("resolve " + ref.tag), opts.json);
                return 1;
            }

            Meta meta = make_meta(resolved.value().path, map_options.value());

            std::optional<std::string> rootfs;
            if (!rc_opts.rootfs.empty())
            {
                rootfs = rc_opts.rootfs;
            }

            auto config = synthesize_runtime_config(cas, resolved.value().manifest, meta, rootfs);
            cas.close();
            if (config.isErr())
            {
                print_error(config.error().withContext("synthesize"), opts.json);
                return 1;
            }

            auto written = write_runtime_config_file(config.value(), rc_opts.config_path);
            if (written.isErr())
            {
                print_error(written.error().withContext("write"), opts.json);
                return 1;
            }

            if (opts.json)
            {
                nlohmann::json j;
                j["ok"] = true;
                j["config"] = rc_opts.config_path;
                j["manifest"] = resolved.value().path.descriptor().digest;
                output_json(j);
            }
            else if (!opts.quiet)
            {
                print_success("Wrote " + rc_opts.config_path, opts.json);
            }
            return 0;
        }

    } // anonymous namespace

    void setup_runtime_config(CLI::App *app, GlobalOptions &opts)
    {
        static RuntimeConfigOptions rc_opts;

        app->footer(
            "When --rootfs is given, the unpacked root filesystem is the source of truth\n"
            "for the process user (/etc/passwd, /etc/group) and for volume ownership.\n"
            "Values found there override the image manifest, so the result can differ\n"
            "from a config generated while unpacking.");

        app->add_option("--image", rc_opts.image, "OCI layout and tag (<path>[:<tag>], tag defaults to latest)")
            ->required();
        app->add_option("--rootfs", rc_opts.rootfs, "Unpacked root filesystem used as source of truth");
        app->add_option("--uid-map", rc_opts.uid_maps, "UID mapping (container:host[:size]), repeatable");
        app->add_option("--gid-map", rc_opts.gid_maps, "GID mapping (container:host[:size]), repeatable");
        app->add_flag("--rootless", rc_opts.rootless, "Generate a rootless configuration");
        app->add_option("config", rc_opts.config_path, "Destination config.json")->required();

        app->callback([&opts]()
                      { std::exit(cmd_runtime_config(opts, rc_opts)); });
    }

} // namespace ocicfg::cli::commands
