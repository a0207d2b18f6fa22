#include "proofline/cli.hpp"
#include "proofline/audit.hpp"
#include "proofline/config.hpp"
#include "proofline/content_store.hpp"
#include "proofline/crypto.hpp"
#include "proofline/digest.hpp"
#include "proofline/engine.hpp"
#include "proofline/http_client.hpp"
#include "proofline/logging.hpp"
#include "proofline/proof_store.hpp"
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>

namespace proofline::cli
{

	namespace
	{
		using Json = nlohmann::json;

		constexpr int kExitOk = 0;
		constexpr int kExitError = 1;
		constexpr int kExitNegative = 2;

		std::atomic<bool> &interrupt_requested()
		{
			static std::atomic<bool> requested{};
			return requested;
		}

		void on_interrupt(int)
		{
			interrupt_requested() = true;
		}

		/** Turns SIGINT / SIGTERM into cancellation of `token` for as long as it lives */
		class InterruptWatcher
		{
		public:
			explicit InterruptWatcher(CancellationToken token) : token_(std::move(token))
			{
				std::signal(SIGINT, on_interrupt);
				std::signal(SIGTERM, on_interrupt);
				thread_ = std::thread([this] {
					while (!stop_.is_cancelled())
					{
						if (interrupt_requested())
						{
							spdlog::warn("interrupt received; cutting off the run");
							token_.cancel();
							return;
						}
						stop_.wait_for(std::chrono::milliseconds(100));
					}
				});
			}

			~InterruptWatcher()
			{
				stop_.cancel();
				thread_.join();
				std::signal(SIGINT, SIG_DFL);
				std::signal(SIGTERM, SIG_DFL);
			}

		private:
			CancellationToken token_;
			CancellationToken stop_;
			std::thread thread_;
		};

		int report_error(const ProoflineError &err)
		{
			std::cerr << err.describe() << std::endl;
			return kExitError;
		}

		Result<std::string> read_text(const std::string &path)
		{
			std::ifstream f(path, std::ios::binary);
			if (!f.is_open())
				return std::unexpected(ProoflineError::io("Unable to open " + path));
			std::stringstream buf;
			buf << f.rdbuf();
			return buf.str();
		}

		Result<Json> read_json(const std::string &path)
		{
			auto text = read_text(path);
			if (!text)
				return std::unexpected(text.error());
			auto j = Json::parse(*text, nullptr, false);
			if (j.is_discarded())
				return std::unexpected(ProoflineError::validation(path + " is not valid JSON"));
			return j;
		}

		Result<Json> read_metadata(const std::string &path)
		{
			if (path.empty())
				return Json::object();
			return read_json(path);
		}

		Result<EngineConfig> load_config(const std::string &path)
		{
			auto cfg = path.empty() ? ConfigLoader::from_string("") : ConfigLoader::load(path);
			if (!cfg)
				return cfg;
			if (auto logging = configure_logging(cfg->logging); !logging)
				return std::unexpected(logging.error());
			return cfg;
		}

		/** Network collaborators and key ring described by a config */
		struct Wiring
		{
			OracleKeyRing keys;
			std::unique_ptr<HttpOracle> oracle;
			std::vector<std::unique_ptr<HttpLedger>> ledgers;
			std::vector<LedgerBinding> bindings;
		};

		Result<std::unique_ptr<Wiring>> wire(const EngineConfig &cfg)
		{
			auto w = std::make_unique<Wiring>();
			for (const auto &key : cfg.oracle.keys)
			{
				if (auto added = w->keys.add_key(key.key_id, key.public_key, key.authority, key.description); !added)
					return std::unexpected(added.error().on_field("oracle.keys"));
			}

			auto oracle_ep = HttpEndpoint::parse(cfg.oracle.endpoint);
			if (!oracle_ep)
				return std::unexpected(oracle_ep.error().on_field("oracle.endpoint"));
			w->oracle = std::make_unique<HttpOracle>(*oracle_ep);

			for (const auto &ledger : cfg.ledgers)
			{
				auto ep = HttpEndpoint::parse(ledger.endpoint);
				if (!ep)
					return std::unexpected(ep.error().on_field("ledgers." + ledger.policy.chain_id + ".endpoint"));
				w->ledgers.push_back(std::make_unique<HttpLedger>(ledger.policy.chain_id, *ep));
				w->bindings.push_back(LedgerBinding{*w->ledgers.back(), ledger.policy});
			}
			return w;
		}

		int print_identity(const std::string &content_path, const std::string &metadata_path)
		{
			auto content = read_file(content_path);
			if (!content)
				return report_error(content.error());
			auto metadata = read_metadata(metadata_path);
			if (!metadata)
				return report_error(metadata.error());

			auto identity = Hasher::derive_identity(*content, *metadata);
			if (!identity)
				return report_error(identity.error());

			Json out = {
				{"content_digest", identity->content_digest.to_hex()},
				{"metadata_digest", identity->metadata_digest.to_hex()},
				{"document_id", identity->document_id.to_hex()}};
			std::cout << out.dump(2) << std::endl;
			return kExitOk;
		}

		int write_output(const std::string &text, const std::string &out_path)
		{
			if (out_path.empty())
			{
				std::cout << text << std::endl;
				return kExitOk;
			}
			std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
			if (!out.is_open())
				return report_error(ProoflineError::io("Unable to open output file " + out_path));
			out << text << '\n';
			return kExitOk;
		}

		int run_attest(const std::string &config_path,
					   const std::string &content_path,
					   const std::string &metadata_path,
					   const std::string &out_path)
		{
			auto cfg = load_config(config_path);
			if (!cfg)
				return report_error(cfg.error());
			auto wiring = wire(*cfg);
			if (!wiring)
				return report_error(wiring.error());

			auto locator = FileContentStore::locate(content_path);
			if (!locator)
				return report_error(locator.error());
			auto metadata = read_metadata(metadata_path);
			if (!metadata)
				return report_error(metadata.error());

			auto proofs = open_proof_store(cfg->storage);
			if (!proofs)
				return report_error(proofs.error());
			auto audit_logger = make_audit_logger(cfg->logging);
			if (!audit_logger)
				return report_error(audit_logger.error());

			SystemClock clock;
			FileContentStore content;
			AuditTrail audit(*audit_logger);

			auto engine = AttestationEngine::create(
				EngineCollaborators{content, *(*wiring)->oracle, (*wiring)->bindings, (*wiring)->keys, clock, proofs->get(), &audit},
				EngineSettings{cfg->oracle.client, cfg->tracker.quorum, cfg->tracker.ceiling});
			if (!engine)
				return report_error(engine.error());

			CancellationToken token;
			Result<ProofArtifact> artifact = std::unexpected(ProoflineError::cancelled("not started"));
			{
				InterruptWatcher watcher(token);
				artifact = (*engine)->attest(*locator, *metadata, token);
			}
			if (!artifact)
				return report_error(artifact.error());

			if (int rc = write_output(artifact->to_json().dump(2), out_path); rc != kExitOk)
				return rc;

			if (artifact->aggregate_status != AggregateStatus::Confirmed)
			{
				std::cerr << "Negative proof: aggregate status "
						  << aggregate_status_to_string(artifact->aggregate_status)
						  << (artifact->forced_cutoff ? " (forced cutoff)" : "") << std::endl;
				return kExitNegative;
			}
			return kExitOk;
		}

		int run_verify(const std::string &config_path,
					   const std::string &artifact_path,
					   const std::string &content_path,
					   const std::string &metadata_path)
		{
			auto cfg = load_config(config_path);
			if (!cfg)
				return report_error(cfg.error());
			auto wiring = wire(*cfg);
			if (!wiring)
				return report_error(wiring.error());

			auto text = read_text(artifact_path);
			if (!text)
				return report_error(text.error());
			auto artifact = ProofArtifact::parse(*text);
			if (!artifact)
				return report_error(artifact.error());

			std::optional<Json> metadata;
			if (!metadata_path.empty())
			{
				auto parsed = read_json(metadata_path);
				if (!parsed)
					return report_error(parsed.error());
				metadata = std::move(*parsed);
			}

			auto quorum = QuorumPolicy::make((*wiring)->bindings.size(), cfg->tracker.quorum);
			if (!quorum)
				return report_error(quorum.error());

			SystemClock clock;
			FileContentStore content;
			Verifier verifier((*wiring)->keys, (*wiring)->bindings, *quorum, clock, &content);

			CancellationToken token;
			InterruptWatcher watcher(token);
			VerificationReport report;
			if (content_path.empty())
			{
				auto stored = verifier.verify_stored(*artifact, metadata, token);
				if (!stored)
					return report_error(stored.error());
				report = std::move(*stored);
			}
			else
			{
				auto bytes = read_file(content_path);
				if (!bytes)
					return report_error(bytes.error());
				report = verifier.verify(*artifact, *bytes, metadata, token);
			}

			std::cout << report.to_json().dump(2) << std::endl;
			return report.verified() ? kExitOk : kExitNegative;
		}

		int run_checksum(const std::string &artifact_path)
		{
			auto text = read_text(artifact_path);
			if (!text)
				return report_error(text.error());
			auto artifact = ProofArtifact::parse(*text);
			if (!artifact)
				return report_error(artifact.error());
			auto computed = artifact->compute_checksum();
			if (!computed)
				return report_error(computed.error());

			bool match = *computed == artifact->artifact_checksum;
			Json out = {
				{"computed", computed->to_hex()},
				{"recorded", artifact->artifact_checksum.to_hex()},
				{"match", match}};
			std::cout << out.dump(2) << std::endl;
			return match ? kExitOk : kExitNegative;
		}

		int run_keygen(const std::string &out_path)
		{
			auto kp = crypto::Ed25519KeyPair::generate();
			if (!kp)
				return report_error(kp.error());
			int rc = write_output(kp->to_json(), out_path);
			if (rc == kExitOk && !out_path.empty())
				std::cout << kp->public_key_b64() << std::endl;
			return rc;
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"Proofline attestation and cross-chain verification engine"};
		app.require_subcommand(1);

		std::string config_path;
		app.add_option("--config", config_path, "Path to config TOML");

		std::string content_path;
		std::string metadata_path;
		std::string artifact_path;
		std::string out_path;

		auto identity_cmd = app.add_subcommand("identity", "Print content digest, metadata digest and document id");
		identity_cmd->add_option("--content", content_path, "Content file")->required();
		identity_cmd->add_option("--metadata", metadata_path, "Metadata JSON file (defaults to {})");

		auto attest_cmd = app.add_subcommand("attest", "Attest a file and emit its proof artifact");
		attest_cmd->add_option("--content", content_path, "Content file")->required();
		attest_cmd->add_option("--metadata", metadata_path, "Metadata JSON file (defaults to {})");
		attest_cmd->add_option("--out", out_path, "Output file path (defaults to stdout)");

		auto verify_cmd = app.add_subcommand("verify", "Independently verify a proof artifact");
		verify_cmd->add_option("--artifact", artifact_path, "Proof artifact JSON")->required();
		verify_cmd->add_option("--content", content_path, "Content file (defaults to the artifact's locator)");
		verify_cmd->add_option("--metadata", metadata_path, "Metadata JSON file");

		auto checksum_cmd = app.add_subcommand("checksum", "Recompute an artifact checksum");
		checksum_cmd->add_option("--artifact", artifact_path, "Proof artifact JSON")->required();

		auto keygen_cmd = app.add_subcommand("keygen", "Generate an Ed25519 oracle key pair");
		keygen_cmd->add_option("--out", out_path, "Output file path (defaults to stdout)");

		auto cfg_cmd = app.add_subcommand("config-print", "Load and print config as JSON");
		cfg_cmd->add_option("--file", config_path, "Config path")->required();

		try
		{
			app.parse(argc, argv);
		}
		catch (const CLI::ParseError &e)
		{
			// --help exits 0; every real usage error maps to 1
			return app.exit(e) == 0 ? kExitOk : kExitError;
		}

		if (*identity_cmd)
			return print_identity(content_path, metadata_path);

		if (*attest_cmd)
			return run_attest(config_path, content_path, metadata_path, out_path);

		if (*verify_cmd)
			return run_verify(config_path, artifact_path, content_path, metadata_path);

		if (*checksum_cmd)
			return run_checksum(artifact_path);

		if (*keygen_cmd)
			return run_keygen(out_path);

		if (*cfg_cmd)
		{
			auto cfg = ConfigLoader::load(config_path);
			if (!cfg)
				return report_error(cfg.error());
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return kExitOk;
		}

		std::cout << app.help() << std::endl;
		return kExitError;
	}

} // namespace proofline::cli
