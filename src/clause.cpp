#include "internal.hpp"

namespace TriSAT {

void Clause::add (int lit) {
  assert (lit), assert (lit != INT_MIN);
  const int idx = abs (lit);
  for (auto & other : literals)
    if (abs (other) == idx) { other = lit; return; }
  literals.push_back (lit);
}

int Clause::sign (int idx) const {
  assert (idx > 0);
  for (const auto & lit : literals)
    if (abs (lit) == idx) return TriSAT::sign (lit);
  return 0;
}

bool Clause::equivalent (const Clause & other) const {
  if (size () != other.size ()) return false;
  for (const auto & lit : literals)
    if (other.sign (abs (lit)) != TriSAT::sign (lit)) return false;
  return true;
}

string Clause::format () const {
  string res;
  char buffer[16];
  for (const auto & lit : literals) {
    if (!res.empty ()) res += ' ';
    sprintf (buffer, "%sx%d", lit < 0 ? "-" : "", abs (lit));
    res += buffer;
  }
  return res;
}

}
