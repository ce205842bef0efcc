// Copyright 2024 Matt Rudary

// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at

//     http://www.apache.org/licenses/LICENSE-2.0

// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "forcer/telescope.h"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace forcer {

telescope_view_t telescope_view_path(const TermPtr& type) {
  if (!type) throw std::invalid_argument("Telescope view of a null type.");
  telescope_view_t view;
  TermPtr t = type;
  while (true) {
    if (t->is_pi()) {
      const auto& p = t->as_pi();
      view.telescope.push_back(p.dom);
      t = p.codomain;
    } else if (t->is_path()) {
      const auto& p = t->as_path();
      view.telescope.push_back(Dom{p.name, Term::interval(), Modality{}});
      t = p.family;
    } else {
      break;
    }
  }
  view.target = std::move(t);
  return view;
}

std::string print_telescope(const Telescope& tel) {
  std::string out;
  std::vector<std::string> context;
  for (const auto& dom : tel) {
    if (!out.empty()) out += ' ';
    out += print_dom(dom, context);
    context.insert(context.begin(), dom.name);
  }
  return out;
}

}  // namespace forcer
