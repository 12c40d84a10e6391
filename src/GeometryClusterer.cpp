#include "mathmark/GeometryClusterer.hpp"

#include <algorithm>
#include <map>
#include <numeric>

namespace mathmark {

namespace {

// Disjoint-set forest with path halving and union by size
class UnionFind {
public:
  explicit UnionFind(size_t count) : parent(count), size(count, 1) {
    std::iota(parent.begin(), parent.end(), 0);
  }

  size_t find(size_t i) {
    while (parent[i] != i) {
      parent[i] = parent[parent[i]];
      i = parent[i];
    }
    return i;
  }

  bool unite(size_t a, size_t b) {
    a = find(a);
    b = find(b);
    if (a == b)
      return false;
    if (size[a] < size[b])
      std::swap(a, b);
    parent[b] = a;
    size[a] += size[b];
    return true;
  }

private:
  std::vector<size_t> parent;
  std::vector<size_t> size;
};

bool isStraightRule(const VectorPrimitive &primitive) {
  return primitive.isHorizontalRule() || primitive.isVerticalRule();
}

} // anonymous namespace

std::string toString(RejectionReason reason) {
  switch (reason) {
  case RejectionReason::None:
    return "accepted";
  case RejectionReason::HeaderFooterZone:
    return "header/footer zone";
  case RejectionReason::TooSmall:
    return "too small";
  case RejectionReason::TooFewPrimitives:
    return "too few primitives";
  case RejectionReason::TooLarge:
    return "too large/whole-page";
  case RejectionReason::TableLike:
    return "table-like";
  case RejectionReason::RuleLike:
    return "rule-like";
  case RejectionReason::BlankRegion:
    return "blank region";
  }
  return "unknown";
}

GeometryClusterer::GeometryClusterer() : m_config() {}

GeometryClusterer::GeometryClusterer(const ClusterConfig &config)
    : m_config(config) {}

double GeometryClusterer::marginX(const Page &page) const {
  return m_config.proximityX * page.width / 2.0;
}

double GeometryClusterer::marginY(const Page &page) const {
  return m_config.proximityY * page.height / 2.0;
}

std::vector<VectorCluster>
GeometryClusterer::clusterPage(const Page &page) const {
  std::vector<VectorCluster> clusters;

  const double dx = marginX(page);
  const double dy = marginY(page);
  const double backgroundArea =
      m_config.backgroundCoverage * page.bounds().area();

  // Skip page backgrounds; they would swallow every other primitive
  std::vector<int> active;
  for (size_t i = 0; i < page.primitives.size(); i++) {
    const auto &box = page.primitives[i].bbox;
    if (backgroundArea > 0 && box.area() >= backgroundArea)
      continue;
    active.push_back(static_cast<int>(i));
  }
  if (active.empty())
    return clusters;

  std::vector<BoundingBox> dilated(active.size());
  for (size_t k = 0; k < active.size(); k++) {
    dilated[k] = page.primitives[active[k]].bbox.expanded(dx, dy);
  }

  // Sweep along x so only boxes that overlap horizontally are compared
  std::vector<size_t> byLeft(active.size());
  std::iota(byLeft.begin(), byLeft.end(), 0);
  std::sort(byLeft.begin(), byLeft.end(), [&](size_t a, size_t b) {
    if (dilated[a].x0 != dilated[b].x0)
      return dilated[a].x0 < dilated[b].x0;
    return a < b;
  });

  UnionFind sets(active.size());
  for (size_t i = 0; i < byLeft.size(); i++) {
    const BoundingBox &a = dilated[byLeft[i]];
    for (size_t j = i + 1; j < byLeft.size(); j++) {
      const BoundingBox &b = dilated[byLeft[j]];
      if (b.x0 > a.x1)
        break;
      if (a.intersects(b))
        sets.unite(byLeft[i], byLeft[j]);
    }
  }

  // Collect components; members stay ascending because k is ascending
  std::map<size_t, size_t> rootToCluster;
  for (size_t k = 0; k < active.size(); k++) {
    size_t root = sets.find(k);
    auto it = rootToCluster.find(root);
    if (it == rootToCluster.end()) {
      VectorCluster cluster;
      cluster.pageIndex = page.index;
      cluster.bbox = page.primitives[active[k]].bbox;
      cluster.members.push_back(active[k]);
      rootToCluster[root] = clusters.size();
      clusters.push_back(cluster);
    } else {
      VectorCluster &cluster = clusters[it->second];
      cluster.bbox = cluster.bbox.unite(page.primitives[active[k]].bbox);
      cluster.members.push_back(active[k]);
    }
  }

  // Component boxes can still overlap (e.g. interleaved L-shapes); merge
  // until the cluster boxes are pairwise disjoint
  bool merged = true;
  while (merged) {
    merged = false;
    for (size_t a = 0; a < clusters.size() && !merged; a++) {
      for (size_t b = a + 1; b < clusters.size(); b++) {
        if (!clusters[a].bbox.intersects(clusters[b].bbox))
          continue;
        clusters[a].bbox = clusters[a].bbox.unite(clusters[b].bbox);
        clusters[a].members.insert(clusters[a].members.end(),
                                   clusters[b].members.begin(),
                                   clusters[b].members.end());
        std::sort(clusters[a].members.begin(), clusters[a].members.end());
        clusters.erase(clusters.begin() + static_cast<long>(b));
        merged = true;
        break;
      }
    }
  }

  sortReadingOrder(clusters, m_config.rowTolerance);
  return clusters;
}

void GeometryClusterer::sortReadingOrder(std::vector<VectorCluster> &clusters,
                                         double rowTolerance) {
  std::sort(clusters.begin(), clusters.end(),
            [](const VectorCluster &a, const VectorCluster &b) {
              if (a.bbox.y0 != b.bbox.y0)
                return a.bbox.y0 < b.bbox.y0;
              if (a.bbox.x0 != b.bbox.x0)
                return a.bbox.x0 < b.bbox.x0;
              return a.members.front() < b.members.front();
            });

  // Bucket into rows anchored on the first cluster of each row, then order
  // each row left to right
  auto rowStart = clusters.begin();
  while (rowStart != clusters.end()) {
    double rowTop = rowStart->bbox.y0;
    auto rowEnd = rowStart;
    while (rowEnd != clusters.end() && rowEnd->bbox.y0 - rowTop <= rowTolerance)
      ++rowEnd;
    std::sort(rowStart, rowEnd,
              [](const VectorCluster &a, const VectorCluster &b) {
                if (a.bbox.x0 != b.bbox.x0)
                  return a.bbox.x0 < b.bbox.x0;
                if (a.bbox.y0 != b.bbox.y0)
                  return a.bbox.y0 < b.bbox.y0;
                return a.members.front() < b.members.front();
              });
    rowStart = rowEnd;
  }
}

RejectionReason GeometryClusterer::classify(const VectorCluster &cluster,
                                            const Page &page) const {
  const BoundingBox &box = cluster.bbox;

  // Header/footer heuristic: entirely inside the top or bottom band
  double band = m_config.headerFooterBand * page.height;
  if (box.y1 <= band || box.y0 >= page.height - band) {
    return RejectionReason::HeaderFooterZone;
  }

  double pageArea = page.bounds().area();
  if ((pageArea > 0 && box.area() > m_config.maxAreaFraction * pageArea) ||
      box.height() > m_config.maxHeightFraction * page.height) {
    return RejectionReason::TooLarge;
  }

  if (box.width() < m_config.minWidth || box.height() < m_config.minHeight) {
    return RejectionReason::TooSmall;
  }

  if (cluster.primitiveCount() < m_config.minPrimitives) {
    return RejectionReason::TooFewPrimitives;
  }

  if (isTableLike(cluster, page)) {
    return RejectionReason::TableLike;
  }

  if (isRuleLike(cluster, page)) {
    return RejectionReason::RuleLike;
  }

  return RejectionReason::None;
}

bool GeometryClusterer::isTableLike(const VectorCluster &cluster,
                                    const Page &page) const {
  const BoundingBox &box = cluster.bbox;
  int horizontalBorders = 0;
  int verticalBorders = 0;
  int rules = 0;
  int cells = 0;

  for (int index : cluster.members) {
    const VectorPrimitive &primitive = page.primitives[index];
    if (primitive.isHorizontalRule()) {
      rules++;
      if (primitive.bbox.width() >= m_config.tableRuleCoverage * box.width())
        horizontalBorders++;
    } else if (primitive.isVerticalRule()) {
      rules++;
      if (primitive.bbox.height() >= m_config.tableRuleCoverage * box.height())
        verticalBorders++;
    } else if (primitive.isRectangle && !primitive.filled &&
               primitive.bbox.width() >= m_config.minHeight &&
               primitive.bbox.height() >= m_config.minHeight) {
      cells++;
    }
  }

  int count = cluster.primitiveCount();
  bool ruledGrid =
      horizontalBorders >= 2 && verticalBorders >= 2 && rules * 2 >= count;
  bool cellGrid = cells >= 4 && cells * 2 >= count;
  return ruledGrid || cellGrid;
}

bool GeometryClusterer::isRuleLike(const VectorCluster &cluster,
                                   const Page &page) const {
  bool allRules = std::all_of(
      cluster.members.begin(), cluster.members.end(),
      [&page](int index) { return isStraightRule(page.primitives[index]); });
  if (allRules) {
    return true;
  }

  // A full-width band is only a displayed equation when it is dense
  const BoundingBox &box = cluster.bbox;
  if (box.width() >= m_config.fullWidthFraction * page.width) {
    double density = cluster.primitiveCount() / (box.width() / 100.0);
    return density < m_config.minFullWidthDensity;
  }
  return false;
}

} // namespace mathmark
