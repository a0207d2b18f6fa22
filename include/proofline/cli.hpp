#pragma once

namespace proofline::cli
{

	/**
	 * Entry point of the `proofline` command.
	 * Exit codes: 0 success / VERIFIED, 1 usage or I/O error,
	 * 2 verification FAILED or negative proof.
	 */
	int run(int argc, char *argv[]);

} // namespace proofline::cli
