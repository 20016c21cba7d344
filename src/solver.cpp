// SPDX-License-Identifier: MIT

#include "qrem/solver.hpp"
#include "qrem/bitstring.hpp"
#include "qrem/log.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace qrem {

namespace {

constexpr double kSingularRtol = 1e-12;
constexpr std::size_t kNormEstimateSweeps = 5;
constexpr std::size_t kExactNormKeys = 64;   // below this, ||A^-1||_1 column by column

double dot(const std::vector<double>& a, const std::vector<double>& b){
  double s = 0.0;
  for (std::size_t i=0; i<a.size(); ++i) s += a[i]*b[i];
  return s;
}

double norm2(const std::vector<double>& a){ return std::sqrt(dot(a, a)); }

bool all_finite(const std::vector<double>& a){
  return std::all_of(a.begin(), a.end(), [](double v){ return std::isfinite(v); });
}

} // namespace

GmresResult gmres(const LinearMap& A, const std::vector<double>& b, const std::vector<double>& diag_inv,
                  double tol, std::size_t max_iter, std::size_t restart){
  const std::size_t n = b.size();
  GmresResult res;
  res.x.assign(n, 0.0);
  const double bnorm = norm2(b);
  if (n == 0 || bnorm == 0.0){ res.converged = true; return res; }
  const std::size_t m = std::max<std::size_t>(1, std::min(restart, n));

  std::vector<double> r = b; // x0 = 0
  double beta = bnorm;
  res.residual = 1.0;
  while (res.iterations < max_iter){
    std::vector<std::vector<double>> V;
    V.reserve(m + 1);
    std::vector<std::vector<double>> H(m + 1, std::vector<double>(m, 0.0));
    std::vector<double> cs(m, 0.0), sn(m, 0.0), g(m + 1, 0.0);
    V.emplace_back(n);
    for (std::size_t i=0; i<n; ++i) V[0][i] = r[i] / beta;
    g[0] = beta;

    std::size_t k = 0;
    double scale = 0.0;
    bool happy = false;
    for (std::size_t j=0; j<m && res.iterations<max_iter; ++j){
      std::vector<double> z(n);
      for (std::size_t i=0; i<n; ++i) z[i] = diag_inv[i] * V[j][i];
      std::vector<double> w = A(z);
      if (w.size() != n || !all_finite(w)){ res.breakdown = true; break; }
      // modified Gram-Schmidt
      for (std::size_t i=0; i<=j; ++i){
        H[i][j] = dot(w, V[i]);
        for (std::size_t t=0; t<n; ++t) w[t] -= H[i][j] * V[i][t];
      }
      const double hn = norm2(w);
      H[j+1][j] = hn;
      double colnorm = hn*hn;
      for (std::size_t i=0; i<=j; ++i) colnorm += H[i][j]*H[i][j];
      scale = std::max(scale, std::sqrt(colnorm));

      for (std::size_t i=0; i<j; ++i){
        double t = cs[i]*H[i][j] + sn[i]*H[i+1][j];
        H[i+1][j] = -sn[i]*H[i][j] + cs[i]*H[i+1][j];
        H[i][j] = t;
      }
      const double denom = std::hypot(H[j][j], H[j+1][j]);
      ++res.iterations;
      if (!(denom > kSingularRtol * scale)){ res.breakdown = true; break; }
      cs[j] = H[j][j] / denom;
      sn[j] = H[j+1][j] / denom;
      H[j][j] = denom;
      H[j+1][j] = 0.0;
      g[j+1] = -sn[j] * g[j];
      g[j] = cs[j] * g[j];
      k = j + 1;
      res.residual = std::fabs(g[j+1]) / bnorm;
      if (res.residual <= tol){ res.converged = true; break; }
      if (hn <= kSingularRtol * scale){ happy = true; break; }
      V.emplace_back(n);
      for (std::size_t t=0; t<n; ++t) V[j+1][t] = w[t] / hn;
    }

    // back-substitution on the k x k triangle
    std::vector<double> y(k, 0.0);
    for (std::size_t ii=k; ii-- > 0;){
      double s = g[ii];
      for (std::size_t c=ii+1; c<k; ++c) s -= H[ii][c] * y[c];
      y[ii] = s / H[ii][ii];
    }
    for (std::size_t c=0; c<k; ++c)
      for (std::size_t i=0; i<n; ++i) res.x[i] += diag_inv[i] * V[c][i] * y[c];
    if (!all_finite(res.x)){ res.breakdown = true; break; }
    if (res.converged || res.breakdown || happy) break;

    // restart from the true residual
    std::vector<double> ax = A(res.x);
    for (std::size_t i=0; i<n; ++i) r[i] = b[i] - ax[i];
    beta = norm2(r);
    res.residual = beta / bnorm;
    if (res.residual <= tol){ res.converged = true; break; }
  }
  return res;
}

QuasiDistribution IterativeCorrector::solve(const ProbDistribution& observed, const ReducedNoiseOperator& op,
                                            const std::vector<std::size_t>& declared_qubits) const {
  if (op.num_bits() < declared_qubits.size())
    throw Error(ErrorCode::UncalibratedSubset, "operator covers " + std::to_string(op.num_bits()) + " of " + std::to_string(declared_qubits.size()) + " declared qubits");
  op.check_subset(declared_qubits);
  if (observed.size() == 0) throw Error(ErrorCode::InvalidArgument, "observed distribution is empty");

  BitstringIndex index(declared_qubits);
  std::vector<BitIndex> keys;
  keys.reserve(observed.size());
  for (const auto& kv : observed.values()) keys.push_back(index.encode(kv.first));

  SolveReport report;
  if (observed.size() == 1){
    report.status = SolveStatus::Trivial;
    report.working_set = 1;
    return QuasiDistribution({{observed.values().begin()->first, 1.0}}, observed.shots(), report, 1.0);
  }

  const WorkingSet ws = op.reachable_set(keys, opts_.expansion_distance, opts_.max_working_set, opts_.max_hamming_distance);
  report.working_set = ws.size();
  report.working_set_truncated = ws.truncated();

  auto fallback = [&](const std::string& why){
    log_warn("CorrectionDegenerate: " + why + "; returning the observed distribution");
    report.status = SolveStatus::Degenerate;
    return QuasiDistribution(observed.values(), observed.shots(), report, 1.0);
  };

  std::vector<double> diag_inv(ws.size());
  for (std::size_t i=0; i<ws.size(); ++i){
    double d = op.diagonal(ws.keys()[i]);
    if (!(std::fabs(d) > 0.0) || !std::isfinite(d)) return fallback("zero diagonal in the noise operator");
    diag_inv[i] = 1.0 / d;
  }

  SparseVector bsp;
  std::size_t pos = 0;
  for (const auto& kv : observed.values()) bsp[keys[pos++]] = kv.second;
  const std::vector<double> b = ws.to_dense(bsp);
  LinearMap A = [&](const std::vector<double>& v){ return op.apply_dense(v, ws); };

  GmresResult g = gmres(A, b, diag_inv, opts_.tol, opts_.max_iter, opts_.restart);
  report.iterations = g.iterations;
  report.residual = g.residual;
  if (g.breakdown) return fallback("noise operator is singular on the working set");

  double s = 0.0;
  for (double v : g.x) s += v;
  if (!std::isfinite(s) || std::fabs(s) < 1e-12) return fallback("corrected vector has no usable mass");

  std::map<std::string, double> values;
  for (std::size_t i=0; i<ws.size(); ++i){
    if (g.x[i] == 0.0) continue;
    values.emplace(index.decode(ws.keys()[i]), g.x[i] / s);
  }
  report.status = g.converged ? SolveStatus::Converged : SolveStatus::IterationCap;
  if (!g.converged)
    log_debug("solver stopped at " + std::to_string(g.iterations) + " iterations, residual " + std::to_string(g.residual));

  std::optional<double> overhead;
  if (opts_.estimate_overhead){
    double nrm = estimate_inverse_norm1(op, ws);
    if (std::isfinite(nrm)) overhead = nrm * nrm;
  }
  return QuasiDistribution(std::move(values), observed.shots(), report, overhead);
}

double IterativeCorrector::estimate_inverse_norm1(const ReducedNoiseOperator& op, const WorkingSet& ws) const {
  const std::size_t n = ws.size();
  if (n == 0) return 0.0;
  std::vector<double> diag_inv(n);
  for (std::size_t i=0; i<n; ++i) diag_inv[i] = 1.0 / op.diagonal(ws.keys()[i]);
  LinearMap A = [&](const std::vector<double>& v){ return op.apply_dense(v, ws); };
  LinearMap AT = [&](const std::vector<double>& v){ return op.apply_dense(v, ws, true); };
  auto column_norm = [&](std::size_t j, std::vector<double>* out){
    std::vector<double> e(n, 0.0);
    e[j] = 1.0;
    GmresResult y = gmres(A, e, diag_inv, opts_.tol, opts_.max_iter, opts_.restart);
    if (y.breakdown) return std::numeric_limits<double>::quiet_NaN();
    double s = 0.0;
    for (double v : y.x) s += std::fabs(v);
    if (out) *out = std::move(y.x);
    return s;
  };

  if (n <= kExactNormKeys){
    double best = 0.0;
    for (std::size_t j=0; j<n; ++j){
      double c = column_norm(j, nullptr);
      if (!std::isfinite(c)) return c;
      best = std::max(best, c);
    }
    return best;
  }

  // Hager-Higham: A^T 1 = 1 for a stochastic map, so the usual uniform start
  // is a fixed point; start from the column with the smallest diagonal instead.
  std::size_t j = static_cast<std::size_t>(std::max_element(diag_inv.begin(), diag_inv.end()) - diag_inv.begin());
  double est = 0.0;
  for (std::size_t sweep=0; sweep<kNormEstimateSweeps; ++sweep){
    std::vector<double> y;
    double cur = column_norm(j, &y);
    if (!std::isfinite(cur)) return sweep == 0 ? cur : est;
    if (sweep > 0 && cur <= est) break;
    est = cur;
    std::vector<double> xi(n);
    for (std::size_t i=0; i<n; ++i) xi[i] = y[i] >= 0.0 ? 1.0 : -1.0;
    GmresResult z = gmres(AT, xi, diag_inv, opts_.tol, opts_.max_iter, opts_.restart);
    if (z.breakdown) break;
    std::size_t jmax = 0;
    for (std::size_t i=1; i<n; ++i) if (std::fabs(z.x[i]) > std::fabs(z.x[jmax])) jmax = i;
    if (jmax == j || std::fabs(z.x[jmax]) <= z.x[j]) break;
    j = jmax;
  }
  // alternating test vector, as in LAPACK xLACON
  std::vector<double> alt(n);
  for (std::size_t i=0; i<n; ++i) alt[i] = (i % 2 ? -1.0 : 1.0) * (1.0 + double(i) / double(n - 1));
  GmresResult y = gmres(A, alt, diag_inv, opts_.tol, opts_.max_iter, opts_.restart);
  if (!y.breakdown){
    double cur = 0.0;
    for (double v : y.x) cur += std::fabs(v);
    est = std::max(est, 2.0 * cur / (3.0 * double(n)));
  }
  return est;
}

} // namespace qrem
