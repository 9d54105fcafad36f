#include "json_io.h"
#include <filesystem>
#include <fstream>
#include <chrono>

namespace mz2d::jsonio {
std::optional<nlohmann::json> readJson(const std::string& path) {
	namespace fs = std::filesystem;
	std::error_code ec;
	const auto size = fs::file_size(path, ec);
	if (ec || size > kMaxConfigBytes) return std::nullopt;

	std::ifstream ifs(path, std::ios::binary);
	if (!ifs) return std::nullopt;
	nlohmann::json j = nlohmann::json::parse(ifs, nullptr, /*allow_exceptions=*/false);
	if (j.is_discarded()) return std::nullopt;
	return j;
}

bool writeJsonAtomic(const std::string& path, const nlohmann::json& j) {
	namespace fs = std::filesystem;
	fs::path target(path);
	fs::path dir = target.parent_path();
	if (!dir.empty()) {
		std::error_code ec;
		fs::create_directories(dir, ec);
	}
	fs::path tmp = target;
	tmp += ".tmp";
	tmp += std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
	{
		std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
		if (!ofs) return false;
		ofs << j.dump(2);
		ofs.flush();
		if (!ofs) {
			ofs.close();
			std::error_code rmEc;
			fs::remove(tmp, rmEc);
			return false;
		}
	}
	std::error_code ec;
	fs::rename(tmp, target, ec);
	if (ec) {
		// rename onto an existing file fails on some platforms
		ec.clear();
		fs::remove(target, ec);
		ec.clear();
		fs::rename(tmp, target, ec);
	}
	if (ec) {
		std::error_code ec2;
		fs::remove(tmp, ec2);
		return false;
	}
	return true;
}
}
