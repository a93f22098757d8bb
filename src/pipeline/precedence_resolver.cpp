// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice,
//    this list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
// ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
// LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
// CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
// SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
// CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
// ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
// POSSIBILITY OF SUCH DAMAGE.

#include <kcenon/dependency_resolver/pipeline/precedence_resolver.h>

#include <algorithm>
#include <cstdlib>
#include <unordered_map>

namespace dependency_resolver::pipeline
{

std::vector<dependency_record> precedence_resolver::resolve(std::vector<dependency_record> records)
{
	std::vector<dependency_record> survivors;
	survivors.reserve(records.size());

	std::unordered_map<object_identity, std::size_t> slot_of;
	slot_of.reserve(records.size());

	for (auto& record : records)
	{
		auto [it, inserted] = slot_of.try_emplace(record.dependent, survivors.size());
		if (inserted)
		{
			survivors.push_back(std::move(record));
			continue;
		}

		auto& kept = survivors[it->second];
		if (std::abs(record.tier) > std::abs(kept.tier))
		{
			kept = std::move(record);
		}
	}

	std::stable_sort(survivors.begin(), survivors.end(),
					 [](const dependency_record& lhs, const dependency_record& rhs)
					 { return lhs.tier < rhs.tier; });

	return survivors;
}

} // namespace dependency_resolver::pipeline
