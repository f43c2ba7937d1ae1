#pragma once

#include <kiln/scm.hpp>
#include <optional>
#include <string>

namespace kiln {

// Clone URL template for (host, visibility), with two %s placeholders for
// owner and name. Returns nullptr for hosts without a template
// (GoogleCode, Custom); those repositories carry a caller-supplied URL.
const char* clone_url_template(HostKind host, bool is_private);

// Render the template for (host, visibility):
//   GitHub,    public   git://github.com/<owner>/<name>.git
//   GitHub,    private  git@github.com:<owner>/<name>.git
//   Bitbucket, public   https://bitbucket.org/<owner>/<name>.git
//   Bitbucket, private  git@bitbucket.org:<owner>/<name>.git
std::optional<std::string> render_clone_url(HostKind host,
                                            const std::string& owner,
                                            const std::string& name,
                                            bool is_private);

} // namespace kiln
