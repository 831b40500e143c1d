// Reader entry points, structural equality and deep copy for declaration forms.
#include "fieldmeta/edn.hpp"
#include <vector>

namespace fieldmeta {

namespace { using detail::reader; using detail::parse_value; }

node_ptr parse_one(std::string_view src) {
	reader r(src);
	r.skip_ws();
	auto v = parse_value(r);
	r.skip_ws();
	if (!r.eof()) {
		throw parse_error("trailing content after single form", r.line, r.col);
	}
	return v;
}

std::vector<node_ptr> parse_all(std::string_view src) {
	reader r(src);
	std::vector<node_ptr> forms;
	r.skip_ws();
	while (!r.eof()) {
		forms.push_back(parse_value(r));
		r.skip_ws();
	}
	return forms;
}

static bool equal_seq(const std::vector<node_ptr>& le, const std::vector<node_ptr>& re, bool ignore_meta);

static bool equal_impl(const node_ptr& a, const node_ptr& b, bool ignore_meta) {
	if (a.get() == b.get()) return true;
	if (!a || !b) return false;
	if (a->data.index() != b->data.index()) return false;

	if (!ignore_meta) {
		if (a->metadata.size() != b->metadata.size()) return false;
		for (const auto& kv : a->metadata) {
			auto it = b->metadata.find(kv.first);
			if (it == b->metadata.end()) return false;
			if (!equal_impl(kv.second, it->second, ignore_meta)) return false;
		}
	}

	struct Visitor {
		const node_ptr& a; const node_ptr& b; bool ignore_meta;
		bool operator()(std::monostate) const { return true; }
		bool operator()(bool) const { return std::get<bool>(a->data) == std::get<bool>(b->data); }
		bool operator()(int64_t) const { return std::get<int64_t>(a->data) == std::get<int64_t>(b->data); }
		bool operator()(double) const { return std::get<double>(a->data) == std::get<double>(b->data); }
		bool operator()(const std::string&) const { return std::get<std::string>(a->data) == std::get<std::string>(b->data); }
		bool operator()(const keyword&) const { return std::get<keyword>(a->data).name == std::get<keyword>(b->data).name; }
		bool operator()(const symbol&) const { return std::get<symbol>(a->data).name == std::get<symbol>(b->data).name; }
		bool operator()(const list&) const { return equal_seq(std::get<list>(a->data).elems, std::get<list>(b->data).elems, ignore_meta); }
		bool operator()(const vector_t&) const { return equal_seq(std::get<vector_t>(a->data).elems, std::get<vector_t>(b->data).elems, ignore_meta); }
		bool operator()(const map&) const {
			const auto& lm = std::get<map>(a->data).entries;
			const auto& rm = std::get<map>(b->data).entries;
			if (lm.size() != rm.size()) return false;
			// maps compare unordered
			std::vector<bool> used(rm.size());
			for (const auto& kv : lm) {
				bool found = false;
				for (size_t j = 0; j < rm.size(); ++j) {
					if (!used[j] && equal_impl(kv.first, rm[j].first, ignore_meta) && equal_impl(kv.second, rm[j].second, ignore_meta)) { used[j] = true; found = true; break; }
				}
				if (!found) return false;
			}
			return true;
		}
	};

	return std::visit(Visitor{a, b, ignore_meta}, a->data);
}

static bool equal_seq(const std::vector<node_ptr>& le, const std::vector<node_ptr>& re, bool ignore_meta) {
	if (le.size() != re.size()) return false;
	for (size_t i = 0; i < le.size(); ++i) if (!equal_impl(le[i], re[i], ignore_meta)) return false;
	return true;
}

bool equal(const node_ptr& a, const node_ptr& b, bool ignore_metadata) { return equal_impl(a, b, ignore_metadata); }

node_ptr clone(const node_ptr& n) {
	if (!n) return nullptr;
	auto out = std::make_shared<node>();
	out->metadata = n->metadata;
	std::visit([&](auto&& arg) {
		using T = std::decay_t<decltype(arg)>;
		if constexpr (std::is_same_v<T, list>) { list l; l.elems.reserve(arg.elems.size()); for (auto& ch : arg.elems) l.elems.push_back(clone(ch)); out->data = std::move(l); }
		else if constexpr (std::is_same_v<T, vector_t>) { vector_t v; v.elems.reserve(arg.elems.size()); for (auto& ch : arg.elems) v.elems.push_back(clone(ch)); out->data = std::move(v); }
		else if constexpr (std::is_same_v<T, map>) { map m; m.entries.reserve(arg.entries.size()); for (auto& kv : arg.entries) m.entries.emplace_back(clone(kv.first), clone(kv.second)); out->data = std::move(m); }
		else { out->data = arg; }
	}, n->data);
	return out;
}

} // namespace fieldmeta
